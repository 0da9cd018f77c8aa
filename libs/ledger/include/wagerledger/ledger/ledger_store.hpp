#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace ledger {

struct GameRecord {
  common::Seed bump{0};
  common::Identity authority{};
};

struct UserAccount {
  common::Identity owner{};
  common::Amount balance{0};
};

// Durable records of one game. Field access only; every rule about how the
// records may change lives in settlement::SettlementEngine.
class LedgerStore {
 public:
  [[nodiscard]] bool has_game() const noexcept { return game_.has_value(); }
  [[nodiscard]] const GameRecord* game() const noexcept;
  [[nodiscard]] const common::Identity* operating_owner() const noexcept;

  // Returns false if the game record already exists.
  bool create_game(const GameRecord& record, const common::Identity& operating_owner);

  // Returns false if a record for the owner already exists.
  bool create_account(const common::Identity& owner);

  [[nodiscard]] const UserAccount* find_account(const common::Identity& owner) const;
  void set_balance(const common::Identity& owner, common::Amount balance);

  [[nodiscard]] bool has_applied(const common::IdempotencyKey& key) const;
  void mark_applied(const common::IdempotencyKey& key);

  // Sorted by owner so that images and listings are deterministic.
  [[nodiscard]] std::vector<UserAccount> accounts() const;
  [[nodiscard]] std::vector<common::IdempotencyKey> applied_keys() const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }

  // Sum of all balances, or nullopt if it does not fit in an Amount.
  [[nodiscard]] std::optional<common::Amount> total_balance() const;

  void clear();

 private:
  std::optional<GameRecord> game_{};
  std::optional<common::Identity> operating_owner_{};
  std::unordered_map<common::Identity, UserAccount, common::IdentityHash> accounts_{};
  std::unordered_set<common::IdempotencyKey, common::IdempotencyKeyHash> applied_keys_{};
};

// Snapshot image layout:
// [magic:4][version:2][has_game:1]
//   ([bump:1][authority:32][operating_owner:32])?
// [account_count:4] ([owner:32][balance:8])*
// [key_count:4] ([key:16])*
std::vector<std::byte> encode_store(const LedgerStore& store);
void decode_store(std::span<const std::byte> image, LedgerStore& out_store);

}  // namespace ledger
}  // namespace wagerledger
