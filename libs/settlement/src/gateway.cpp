#include "wagerledger/settlement/gateway.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "wagerledger/common/time_utils.hpp"
#include "wagerledger/settlement/request_codec.hpp"

namespace wagerledger {
namespace settlement {

namespace {

void record_flow(telemetry::TelemetrySink& sink, const Request& request, const OperationResult& result) {
  std::visit(
      [&](const auto& body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, Deposit> || std::is_same_v<T, AdminDeposit>) {
          sink.record_inflow(body.amount);
        } else if constexpr (std::is_same_v<T, Withdraw> || std::is_same_v<T, AdminWithdraw>) {
          sink.record_outflow(body.amount);
        } else if constexpr (std::is_same_v<T, AttestOutcome>) {
          sink.record_fee(result.fee);
        }
      },
      request);
}

}  // namespace

Gateway::Gateway(SettlementEngine& engine, wal::Writer& journal, telemetry::TelemetrySink* telemetry)
    : engine_(engine), journal_(journal), telemetry_(telemetry) {}

OperationResult Gateway::submit(const common::Identity& caller, const Envelope& envelope) {
  std::lock_guard<std::mutex> lock(mutex_);
  return submit_locked(caller, envelope);
}

OperationResult Gateway::submit_signed(std::span<const std::byte> frame) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto signed_frame = auth::split_signed_frame(frame);
  if (!signed_frame) {
    ++stats_.malformed;
    count(kMetricMalformed);
    return reject(Status::kMalformedRequest);
  }

  if (!authenticator_.verify(signed_frame->signer, signed_frame->message, signed_frame->signature)) {
    ++stats_.rejected_auth;
    count(kMetricRejectedAuth);
    return reject(Status::kInvalidSignature);
  }

  Envelope envelope;
  try {
    envelope = codec::decode_envelope(signed_frame->message);
  } catch (const std::runtime_error&) {
    ++stats_.malformed;
    count(kMetricMalformed);
    return reject(Status::kMalformedRequest);
  }

  // A signed frame can be captured and resent; only the key tells a resend apart.
  if (!envelope.idempotency_key) {
    ++stats_.malformed;
    count(kMetricMalformed);
    return reject(Status::kMalformedRequest);
  }

  return submit_locked(signed_frame->signer, envelope);
}

Gateway::Stats Gateway::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

OperationResult Gateway::submit_locked(const common::Identity& caller, const Envelope& envelope) {
  const auto started = common::now_steady();
  auto result = engine_.apply(caller, envelope);

  if (result.ok()) {
    const auto payload = codec::encode(codec::JournalEntry{.caller = caller, .envelope = envelope});
    journal_.append(payload);
    ++stats_.accepted;
    count(kMetricAccepted);
    if (telemetry_) {
      record_flow(*telemetry_, envelope.request, result);
    }
  } else {
    ++stats_.rejected;
    count(kMetricRejected);
  }

  if (telemetry_) {
    telemetry_->record_latency(static_cast<std::uint64_t>(kind_of(envelope.request)),
                               common::now_steady() - started);
  }
  return result;
}

void Gateway::count(std::uint64_t metric) {
  if (telemetry_) {
    telemetry_->increment(metric);
  }
}

}  // namespace settlement
}  // namespace wagerledger
