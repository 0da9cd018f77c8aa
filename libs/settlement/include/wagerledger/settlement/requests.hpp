#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace settlement {

enum class OperationKind : std::uint8_t {
  kInitialize = 1,
  kCreateUserAccount = 2,
  kDeposit = 3,
  kWithdraw = 4,
  kAttestOutcome = 5,
  kAdminDeposit = 6,
  kAdminWithdraw = 7,
};

const char* to_string(OperationKind kind) noexcept;

struct Initialize {
  common::Seed seed{0};
  common::Identity authority{};
};

struct CreateUserAccount {
  common::Identity user{};
};

struct Deposit {
  common::Amount amount{0};
  common::Identity user{};
  common::Identity source{};       // user's token account
  common::Identity destination{};  // must be the game vault
};

struct Withdraw {
  common::Amount amount{0};
  common::Identity user{};
  common::Identity destination{};  // user's token account
};

// Participants of a settled round. Either side may be absent.
struct NoParticipants {};

struct WinnerOnly {
  common::Identity winner{};
};

struct LoserOnly {
  common::Identity loser{};
};

struct WinnerAndLoser {
  common::Identity winner{};
  common::Identity loser{};
};

using Outcome = std::variant<NoParticipants, WinnerOnly, LoserOnly, WinnerAndLoser>;

struct AttestOutcome {
  common::Amount stake{0};
  Outcome outcome{};
};

struct AdminDeposit {
  common::Amount amount{0};
  common::Identity source{};  // admin's token account
};

struct AdminWithdraw {
  common::Amount amount{0};
  common::Identity destination{};  // admin's token account
};

using Request = std::variant<Initialize,
                             CreateUserAccount,
                             Deposit,
                             Withdraw,
                             AttestOutcome,
                             AdminDeposit,
                             AdminWithdraw>;

struct Envelope {
  Request request{};
  std::optional<common::IdempotencyKey> idempotency_key{};
};

[[nodiscard]] OperationKind kind_of(const Request& request) noexcept;

inline constexpr std::optional<common::Identity> winner_of(const Outcome& outcome) noexcept {
  if (const auto* w = std::get_if<WinnerOnly>(&outcome)) {
    return w->winner;
  }
  if (const auto* both = std::get_if<WinnerAndLoser>(&outcome)) {
    return both->winner;
  }
  return std::nullopt;
}

inline constexpr std::optional<common::Identity> loser_of(const Outcome& outcome) noexcept {
  if (const auto* l = std::get_if<LoserOnly>(&outcome)) {
    return l->loser;
  }
  if (const auto* both = std::get_if<WinnerAndLoser>(&outcome)) {
    return both->loser;
  }
  return std::nullopt;
}

}  // namespace settlement
}  // namespace wagerledger
