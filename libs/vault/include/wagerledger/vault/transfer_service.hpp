#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "wagerledger/auth/authenticator.hpp"
#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace vault {

enum class TransferStatus : std::uint8_t {
  kCompleted,
  kUnknownAccount,
  kInsufficientTokens,
  kUnauthorized,
  kOverflow,
};

const char* to_string(TransferStatus status) noexcept;

struct TransferRequest {
  common::Amount amount{0};
  common::Identity source{};       // token account address
  common::Identity destination{};  // token account address
  common::Identity signer{};       // must own `source` unless `credential` is set
  std::optional<auth::VaultCredential> credential{};
};

// Moves tokens between token accounts held outside the ledger. A transfer
// either completes in full or has no effect.
class TransferService {
 public:
  virtual ~TransferService() = default;
  [[nodiscard]] virtual TransferStatus transfer(const TransferRequest& request) = 0;
};

struct TokenAccount {
  common::Identity address{};
  common::Identity owner{};
  common::Amount amount{0};
};

// In-process token custody used by the daemon and the tests.
class LocalVault final : public TransferService {
 public:
  // Returns false if the address is already taken.
  bool open_account(const common::Identity& address, const common::Identity& owner);

  // Creates tokens out of nothing. Operator faucet for local runs. Fails if
  // the account is unknown or total supply would exceed the Amount range.
  bool mint(const common::Identity& address, common::Amount amount);

  [[nodiscard]] TransferStatus transfer(const TransferRequest& request) override;

  [[nodiscard]] std::optional<TokenAccount> account(const common::Identity& address) const;

  // Tokens held in all token accounts owned by `owner`.
  [[nodiscard]] common::Amount custodied(const common::Identity& owner) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::Identity, TokenAccount, common::IdentityHash> accounts_;
  common::Amount supply_{0};
};

// Accepts every transfer. Used while re-applying journalled requests, whose
// tokens already moved when they were first applied.
class ReplayVault final : public TransferService {
 public:
  [[nodiscard]] TransferStatus transfer(const TransferRequest&) override {
    return TransferStatus::kCompleted;
  }
};

}  // namespace vault
}  // namespace wagerledger
