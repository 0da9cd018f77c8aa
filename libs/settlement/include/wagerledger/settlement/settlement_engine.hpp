#pragma once

#include <cstdint>
#include <optional>

#include "wagerledger/auth/authenticator.hpp"
#include "wagerledger/common/types.hpp"
#include "wagerledger/ledger/ledger_store.hpp"
#include "wagerledger/settlement/requests.hpp"
#include "wagerledger/vault/transfer_service.hpp"

namespace wagerledger {
namespace settlement {

enum class Status : std::uint8_t {
  kOk,
  kInsufficientFunds,
  kUnauthorized,
  kArithmeticError,
  kAlreadyExists,
  kTransferFailed,
  kNotFound,
  kNotInitialized,
  kInvalidVault,
  kDuplicateRequest,
  kInvalidSignature,
  kMalformedRequest,
};

const char* to_string(Status status) noexcept;

struct OperationResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
  vault::TransferStatus transfer_status{vault::TransferStatus::kCompleted};
  common::Amount fee{0};  // attest-outcome only
  common::Amount net{0};  // attest-outcome only

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

[[nodiscard]] OperationResult reject(Status status) noexcept;

// Fee retained by the game from a settled stake: floor(stake / 10).
[[nodiscard]] inline constexpr common::Amount settlement_fee(common::Amount stake) noexcept {
  return stake / 10;
}

struct EngineConfig {
  auth::ProgramId program_id{};
};

// Stateless transition functions over a LedgerStore. Every operation either
// commits all of its balance changes (after the vault transfer, if any, has
// completed) or returns a rejection and leaves the store untouched.
//
// The caller identity is taken as already verified. The engine only compares
// it against the records it is about to touch.
class SettlementEngine {
 public:
  SettlementEngine(EngineConfig config, ledger::LedgerStore& store, vault::TransferService& vault);

  OperationResult apply(const common::Identity& caller, const Envelope& envelope);
  OperationResult apply(const common::Identity& caller, const Request& request);

  OperationResult initialize(const common::Identity& caller, const Initialize& request);
  OperationResult create_user_account(const common::Identity& caller, const CreateUserAccount& request);
  OperationResult deposit(const common::Identity& caller, const Deposit& request);
  OperationResult withdraw(const common::Identity& caller, const Withdraw& request);
  OperationResult attest_outcome(const common::Identity& caller, const AttestOutcome& request);
  OperationResult admin_deposit(const common::Identity& caller, const AdminDeposit& request);
  OperationResult admin_withdraw(const common::Identity& caller, const AdminWithdraw& request);

  // Identity owning both the operating account and the vault token account.
  // Empty before initialize.
  [[nodiscard]] std::optional<common::Identity> game_identity() const;
  [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

 private:
  EngineConfig config_;
  ledger::LedgerStore& store_;
  vault::TransferService& vault_;

  [[nodiscard]] auth::VaultCredential vault_credential(const ledger::GameRecord& game) const;
  OperationResult credit_from_vault_transfer(const common::Identity& caller,
                                             const common::Identity& account_owner,
                                             common::Amount amount,
                                             const common::Identity& source,
                                             const common::Identity& destination);
  OperationResult debit_to_vault_transfer(const ledger::GameRecord& game,
                                          const common::Identity& account_owner,
                                          common::Amount amount,
                                          const common::Identity& destination);
};

struct Reconciliation {
  common::Amount liabilities{0};
  common::Amount custodied{0};
  bool liabilities_overflow{false};

  // The ledger never promises more than the vault holds.
  [[nodiscard]] bool solvent() const noexcept {
    return !liabilities_overflow && liabilities <= custodied;
  }
  [[nodiscard]] common::Amount shortfall() const noexcept {
    return solvent() ? 0 : liabilities - custodied;
  }
};

[[nodiscard]] Reconciliation reconcile(const ledger::LedgerStore& store, common::Amount custodied);

}  // namespace settlement
}  // namespace wagerledger
