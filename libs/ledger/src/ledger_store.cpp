#include "wagerledger/ledger/ledger_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "wagerledger/common/byte_codec.hpp"

namespace wagerledger {
namespace ledger {

namespace {
constexpr std::uint32_t kImageMagic = 0x574c5354;  // 'WLST'
constexpr std::uint16_t kImageVersion = 1;
}  // namespace

const GameRecord* LedgerStore::game() const noexcept {
  return game_ ? &*game_ : nullptr;
}

const common::Identity* LedgerStore::operating_owner() const noexcept {
  return operating_owner_ ? &*operating_owner_ : nullptr;
}

bool LedgerStore::create_game(const GameRecord& record, const common::Identity& operating_owner) {
  if (game_ || accounts_.contains(operating_owner)) {
    return false;
  }
  game_ = record;
  operating_owner_ = operating_owner;
  accounts_.emplace(operating_owner, UserAccount{.owner = operating_owner, .balance = 0});
  return true;
}

bool LedgerStore::create_account(const common::Identity& owner) {
  auto [it, inserted] = accounts_.try_emplace(owner, UserAccount{.owner = owner, .balance = 0});
  return inserted;
}

const UserAccount* LedgerStore::find_account(const common::Identity& owner) const {
  auto it = accounts_.find(owner);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

void LedgerStore::set_balance(const common::Identity& owner, common::Amount balance) {
  auto it = accounts_.find(owner);
  if (it == accounts_.end()) {
    throw std::logic_error("set_balance on unknown account " + common::to_hex(owner));
  }
  it->second.balance = balance;
}

bool LedgerStore::has_applied(const common::IdempotencyKey& key) const {
  return applied_keys_.contains(key);
}

void LedgerStore::mark_applied(const common::IdempotencyKey& key) {
  applied_keys_.insert(key);
}

std::vector<UserAccount> LedgerStore::accounts() const {
  std::vector<UserAccount> out;
  out.reserve(accounts_.size());
  for (const auto& [owner, account] : accounts_) {
    out.push_back(account);
  }
  std::sort(out.begin(), out.end(), [](const UserAccount& lhs, const UserAccount& rhs) {
    return lhs.owner < rhs.owner;
  });
  return out;
}

std::vector<common::IdempotencyKey> LedgerStore::applied_keys() const {
  std::vector<common::IdempotencyKey> out(applied_keys_.begin(), applied_keys_.end());
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<common::Amount> LedgerStore::total_balance() const {
  common::Amount total = 0;
  for (const auto& [owner, account] : accounts_) {
    auto next = common::checked_add(total, account.balance);
    if (!next) {
      return std::nullopt;
    }
    total = *next;
  }
  return total;
}

void LedgerStore::clear() {
  game_.reset();
  operating_owner_.reset();
  accounts_.clear();
  applied_keys_.clear();
}

std::vector<std::byte> encode_store(const LedgerStore& store) {
  using namespace common::codec;

  std::vector<std::byte> buffer;
  append_primitive<std::uint32_t>(buffer, kImageMagic);
  append_primitive<std::uint16_t>(buffer, kImageVersion);
  append_primitive<std::uint8_t>(buffer, store.has_game() ? 1 : 0);
  if (const auto* game = store.game()) {
    append_primitive<std::uint8_t>(buffer, game->bump);
    append_array(buffer, game->authority);
    append_array(buffer, *store.operating_owner());
  }

  const auto accounts = store.accounts();
  append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(accounts.size()));
  for (const auto& account : accounts) {
    append_array(buffer, account.owner);
    append_primitive<std::uint64_t>(buffer, account.balance);
  }

  const auto keys = store.applied_keys();
  append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(keys.size()));
  for (const auto& key : keys) {
    append_array(buffer, key);
  }
  return buffer;
}

void decode_store(std::span<const std::byte> image, LedgerStore& out_store) {
  using namespace common::codec;

  std::size_t offset = 0;
  if (read_primitive<std::uint32_t>(image, offset) != kImageMagic) {
    throw std::runtime_error("invalid ledger image magic");
  }
  if (read_primitive<std::uint16_t>(image, offset) != kImageVersion) {
    throw std::runtime_error("unsupported ledger image version");
  }

  LedgerStore store;
  if (read_primitive<std::uint8_t>(image, offset) != 0) {
    GameRecord game;
    game.bump = read_primitive<std::uint8_t>(image, offset);
    game.authority = read_array<common::kIdentitySize>(image, offset);
    const auto operating_owner = read_array<common::kIdentitySize>(image, offset);
    store.create_game(game, operating_owner);
  }

  const auto account_count = read_primitive<std::uint32_t>(image, offset);
  for (std::uint32_t i = 0; i < account_count; ++i) {
    const auto owner = read_array<common::kIdentitySize>(image, offset);
    const auto balance = read_primitive<std::uint64_t>(image, offset);
    store.create_account(owner);
    store.set_balance(owner, balance);
  }

  const auto key_count = read_primitive<std::uint32_t>(image, offset);
  for (std::uint32_t i = 0; i < key_count; ++i) {
    store.mark_applied(read_array<std::tuple_size_v<common::IdempotencyKey>>(image, offset));
  }

  if (offset != image.size()) {
    throw std::runtime_error("trailing bytes in ledger image");
  }
  out_store = std::move(store);
}

}  // namespace ledger
}  // namespace wagerledger
