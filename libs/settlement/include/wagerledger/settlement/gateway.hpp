#pragma once

#include <cstdint>
#include <mutex>
#include <span>

#include "wagerledger/auth/authenticator.hpp"
#include "wagerledger/settlement/requests.hpp"
#include "wagerledger/settlement/settlement_engine.hpp"
#include "wagerledger/telemetry/telemetry_sink.hpp"
#include "wagerledger/wal/journal.hpp"

namespace wagerledger {
namespace settlement {

// Telemetry ids. Latency is recorded under the OperationKind value (1..7).
constexpr std::uint64_t kMetricAccepted = 32;
constexpr std::uint64_t kMetricRejected = 33;
constexpr std::uint64_t kMetricRejectedAuth = 34;
constexpr std::uint64_t kMetricMalformed = 35;

// Front door to the engine. Runs one request at a time and journals every
// request that the engine accepted, so the ledger can be rebuilt by replay.
class Gateway {
 public:
  struct Stats {
    std::uint64_t accepted{0};
    std::uint64_t rejected{0};
    std::uint64_t rejected_auth{0};
    std::uint64_t malformed{0};
  };

  Gateway(SettlementEngine& engine, wal::Writer& journal, telemetry::TelemetrySink* telemetry = nullptr);

  // `caller` must already be verified by the collaborator layer.
  OperationResult submit(const common::Identity& caller, const Envelope& envelope);

  // Frame layout: see auth::SignedFrame. The signer becomes the caller. The
  // envelope must carry an idempotency key.
  OperationResult submit_signed(std::span<const std::byte> frame);

  [[nodiscard]] Stats stats() const;

 private:
  SettlementEngine& engine_;
  wal::Writer& journal_;
  telemetry::TelemetrySink* telemetry_;
  auth::Authenticator authenticator_;
  mutable std::mutex mutex_;
  Stats stats_{};

  OperationResult submit_locked(const common::Identity& caller, const Envelope& envelope);
  void count(std::uint64_t metric);
};

}  // namespace settlement
}  // namespace wagerledger
