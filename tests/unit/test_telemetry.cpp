#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>

#include "wagerledger/telemetry/telemetry_sink.hpp"

namespace wagerledger::tests {

void test_telemetry_sink() {
  telemetry::TelemetrySink sink(3);
  sink.push({.id = 1, .value = 99});
  sink.increment(32, 2);
  sink.increment(33);
  sink.increment(33);
  assert(sink.dropped() == 1);

  sink.record_latency(3, std::chrono::nanoseconds{100});
  sink.record_latency(3, std::chrono::nanoseconds{200});
  sink.record_latency(5, std::chrono::microseconds{4});

  auto samples = sink.drain();
  assert(samples.size() == 3);
  assert(samples[1].id == 32);
  assert(samples[1].value == 2);
  assert(sink.drain().empty());

  auto latency = sink.drain_latency();
  assert(latency.size() == 2);
  assert(latency.front().id == 3);
  assert(latency.front().count == 2);
  assert(latency.front().p50_ns <= latency.front().p99_ns);
  assert(latency.back().id == 5);
  assert(sink.drain_latency().empty());

  sink.record_inflow(1'000);
  sink.record_inflow(500);
  sink.record_outflow(300);
  sink.record_fee(50);
  sink.record_fee(std::numeric_limits<std::uint64_t>::max());
  const auto flows = sink.flows();
  assert(flows.inflow == 1'500);
  assert(flows.outflow == 300);
  assert(flows.fees == std::numeric_limits<std::uint64_t>::max());
}

void test_latency_histogram() {
  telemetry::LatencyHistogram histogram;
  assert(histogram.quantile_ns(0.5) == 0);

  for (int i = 0; i < 99; ++i) {
    histogram.record(std::chrono::nanoseconds{100});
  }
  histogram.record(std::chrono::milliseconds{1});
  assert(histogram.count() == 100);
  // 100ns has bit width 7, so the bucket tops out at 127.
  assert(histogram.quantile_ns(0.50) == 127);
  assert(histogram.quantile_ns(0.99) == 127);
  assert(histogram.quantile_ns(1.0) == (std::uint64_t{1} << 20) - 1);
  assert(histogram.mean_ns() == (99.0 * 100.0 + 1'000'000.0) / 100.0);

  histogram.record(std::chrono::nanoseconds{-5});
  assert(histogram.count() == 101);

  histogram.clear();
  assert(histogram.count() == 0);
  assert(histogram.mean_ns() == 0.0);
}

}  // namespace wagerledger::tests
