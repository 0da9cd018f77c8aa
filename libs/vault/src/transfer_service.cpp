#include "wagerledger/vault/transfer_service.hpp"

namespace wagerledger {
namespace vault {

const char* to_string(TransferStatus status) noexcept {
  switch (status) {
    case TransferStatus::kCompleted:
      return "completed";
    case TransferStatus::kUnknownAccount:
      return "unknown token account";
    case TransferStatus::kInsufficientTokens:
      return "insufficient tokens";
    case TransferStatus::kUnauthorized:
      return "unauthorized";
    case TransferStatus::kOverflow:
      return "overflow";
  }
  return "unknown";
}

bool LocalVault::open_account(const common::Identity& address, const common::Identity& owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = accounts_.try_emplace(address, TokenAccount{.address = address, .owner = owner, .amount = 0});
  return inserted;
}

bool LocalVault::mint(const common::Identity& address, common::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(address);
  if (it == accounts_.end()) {
    return false;
  }
  auto supply = common::checked_add(supply_, amount);
  if (!supply) {
    return false;
  }
  supply_ = *supply;
  it->second.amount += amount;
  return true;
}

TransferStatus LocalVault::transfer(const TransferRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto source = accounts_.find(request.source);
  auto destination = accounts_.find(request.destination);
  if (source == accounts_.end() || destination == accounts_.end()) {
    return TransferStatus::kUnknownAccount;
  }

  if (request.credential) {
    if (!request.credential->authorizes(source->second.owner)) {
      return TransferStatus::kUnauthorized;
    }
  } else if (request.signer != source->second.owner) {
    return TransferStatus::kUnauthorized;
  }

  if (request.amount > source->second.amount) {
    return TransferStatus::kInsufficientTokens;
  }
  if (source != destination) {
    auto credited = common::checked_add(destination->second.amount, request.amount);
    if (!credited) {
      return TransferStatus::kOverflow;
    }
    source->second.amount -= request.amount;
    destination->second.amount = *credited;
  }

  return TransferStatus::kCompleted;
}

std::optional<TokenAccount> LocalVault::account(const common::Identity& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(address);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Amount LocalVault::custodied(const common::Identity& owner) const {
  std::lock_guard<std::mutex> lock(mutex_);
  common::Amount total = 0;
  for (const auto& [address, account] : accounts_) {
    if (account.owner == owner) {
      // Bounded by supply_, so this cannot wrap.
      total += account.amount;
    }
  }
  return total;
}

}  // namespace vault
}  // namespace wagerledger
