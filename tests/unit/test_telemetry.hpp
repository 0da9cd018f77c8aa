#pragma once

namespace wagerledger::tests {

void test_telemetry_sink();
void test_latency_histogram();

}  // namespace wagerledger::tests
