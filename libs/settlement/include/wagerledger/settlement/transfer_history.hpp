#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace settlement {

enum class TransferDirection : std::uint8_t {
  kDeposit,
  kWithdraw,
};

const char* to_string(TransferDirection direction) noexcept;

// One token movement between the game vault and an owner's token account.
struct TransferRecord {
  std::uint64_t sequence{0};  // journal sequence, unique across records
  TransferDirection direction{TransferDirection::kDeposit};
  common::Amount amount{0};
  common::Identity token_account{};  // deposit source or withdraw destination
  bool admin{false};
  std::optional<common::IdempotencyKey> idempotency_key{};
};

// Deposits and withdrawals of `owner`, oldest first, read from the journal at
// `wal_path`. Only accepted requests are journalled, so every record here
// completed. Admin transfers are listed under the authority that made them.
// Returns an empty list when no journal exists yet.
std::vector<TransferRecord> transfer_history(const std::filesystem::path& wal_path, const common::Identity& owner);

}  // namespace settlement
}  // namespace wagerledger
