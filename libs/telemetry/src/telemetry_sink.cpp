#include "wagerledger/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>

namespace wagerledger {
namespace telemetry {

namespace {

void saturating_add(std::uint64_t& total, std::uint64_t amount) noexcept {
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  total = amount > kMax - total ? kMax : total + amount;
}

}  // namespace

void LatencyHistogram::record(std::chrono::nanoseconds latency) noexcept {
  const auto ns = static_cast<std::uint64_t>(std::max<std::int64_t>(latency.count(), 0));
  const auto bucket = std::min<std::size_t>(static_cast<std::size_t>(std::bit_width(ns)), kBuckets - 1);
  ++buckets_[bucket];
  ++count_;
  saturating_add(total_ns_, ns);
}

void LatencyHistogram::clear() noexcept {
  buckets_ = {};
  count_ = 0;
  total_ns_ = 0;
}

double LatencyHistogram::mean_ns() const noexcept {
  return count_ == 0 ? 0.0 : static_cast<double>(total_ns_) / static_cast<double>(count_);
}

std::uint64_t LatencyHistogram::quantile_ns(double q) const noexcept {
  if (count_ == 0) {
    return 0;
  }
  const auto rank = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::ceil(q * static_cast<double>(count_))));
  std::uint64_t seen = 0;
  for (std::size_t bucket = 0; bucket < kBuckets; ++bucket) {
    seen += buckets_[bucket];
    if (seen >= rank) {
      return bucket == 0 ? 0 : (std::uint64_t{1} << bucket) - 1;
    }
  }
  return (std::uint64_t{1} << (kBuckets - 1)) - 1;
}

TelemetrySink::TelemetrySink(std::size_t buffer_size) : capacity_(buffer_size) {
  pending_.reserve(capacity_);
}

void TelemetrySink::push(Sample sample) {
  std::scoped_lock lock(mutex_);
  if (pending_.size() < capacity_) {
    pending_.push_back(sample);
  } else {
    ++dropped_;
  }
}

void TelemetrySink::increment(std::uint64_t id, std::int64_t delta) {
  push(Sample{.id = id, .value = delta});
}

void TelemetrySink::record_latency(std::uint64_t id, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  latencies_[id % kMaxMetricId].record(latency);
}

void TelemetrySink::record_inflow(std::uint64_t amount) {
  std::scoped_lock lock(mutex_);
  saturating_add(flows_.inflow, amount);
}

void TelemetrySink::record_outflow(std::uint64_t amount) {
  std::scoped_lock lock(mutex_);
  saturating_add(flows_.outflow, amount);
}

void TelemetrySink::record_fee(std::uint64_t amount) {
  std::scoped_lock lock(mutex_);
  saturating_add(flows_.fees, amount);
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  std::vector<Sample> out;
  out.reserve(capacity_);
  out.swap(pending_);
  return out;
}

std::uint64_t TelemetrySink::dropped() const {
  std::scoped_lock lock(mutex_);
  return dropped_;
}

FlowTotals TelemetrySink::flows() const {
  std::scoped_lock lock(mutex_);
  return flows_;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;
  for (std::size_t id = 0; id < kMaxMetricId; ++id) {
    auto& histogram = latencies_[id];
    if (histogram.count() == 0) {
      continue;
    }
    summaries.push_back(Summary{
        .id = id,
        .count = histogram.count(),
        .mean_ns = histogram.mean_ns(),
        .p50_ns = histogram.quantile_ns(0.50),
        .p99_ns = histogram.quantile_ns(0.99),
    });
    histogram.clear();
  }
  return summaries;
}

}  // namespace telemetry
}  // namespace wagerledger
