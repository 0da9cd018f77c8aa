#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace wagerledger {
namespace telemetry {

struct Sample {
  std::uint64_t id{};
  std::int64_t value{};
};

// Tokens that crossed the vault boundary, and fees booked to the game.
// Totals saturate instead of wrapping.
struct FlowTotals {
  std::uint64_t inflow{0};
  std::uint64_t outflow{0};
  std::uint64_t fees{0};
};

// Bucket i counts latencies whose nanosecond value has bit width i.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::chrono::nanoseconds latency) noexcept;
  void clear() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean_ns() const noexcept;
  // Upper bound of the bucket that holds the q-quantile.
  [[nodiscard]] std::uint64_t quantile_ns(double q) const noexcept;

 private:
  std::array<std::uint64_t, kBuckets> buckets_{};
  std::uint64_t count_{0};
  std::uint64_t total_ns_{0};
};

class TelemetrySink {
 public:
  static constexpr std::size_t kMaxMetricId = 64;

  explicit TelemetrySink(std::size_t buffer_size = 1024);

  // Drops the sample once buffer_size samples are waiting to be drained.
  void push(Sample sample);
  void increment(std::uint64_t id, std::int64_t delta = 1);
  void record_latency(std::uint64_t id, std::chrono::nanoseconds latency);

  void record_inflow(std::uint64_t amount);
  void record_outflow(std::uint64_t amount);
  void record_fee(std::uint64_t amount);

  [[nodiscard]] std::vector<Sample> drain();
  [[nodiscard]] std::uint64_t dropped() const;
  [[nodiscard]] FlowTotals flows() const;

  struct Summary {
    std::uint64_t id{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    std::uint64_t p50_ns{0};
    std::uint64_t p99_ns{0};
  };

  // One summary per metric id with recorded latencies; clears them.
  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::size_t capacity_;
  std::uint64_t dropped_{0};
  std::vector<Sample> pending_{};
  std::array<LatencyHistogram, kMaxMetricId> latencies_{};
  FlowTotals flows_{};
};

}  // namespace telemetry
}  // namespace wagerledger
