#include "wagerledger/settlement/settlement_engine.hpp"

#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace wagerledger {
namespace settlement {

namespace {
constexpr std::uint16_t kRejectCodeInsufficientFunds = 3001;
constexpr std::uint16_t kRejectCodeUnauthorized = 3002;
constexpr std::uint16_t kRejectCodeArithmetic = 3003;
constexpr std::uint16_t kRejectCodeAlreadyExists = 3004;
constexpr std::uint16_t kRejectCodeTransferFailed = 3005;
constexpr std::uint16_t kRejectCodeNotFound = 3006;
constexpr std::uint16_t kRejectCodeNotInitialized = 3007;
constexpr std::uint16_t kRejectCodeInvalidVault = 3008;
constexpr std::uint16_t kRejectCodeDuplicate = 3009;
constexpr std::uint16_t kRejectCodeInvalidSignature = 3010;
constexpr std::uint16_t kRejectCodeMalformed = 3011;

// At most the winner, the loser and the operating account change in one
// transition.
constexpr std::size_t kMaxTouchedAccounts = 3;

// Working copy of the balances one transition touches. Nothing reaches the
// store until commit().
class StagedBalances {
 public:
  explicit StagedBalances(const ledger::LedgerStore& store) : store_(store) {
    entries_.reserve(kMaxTouchedAccounts);
  }

  Status credit(const common::Identity& owner, common::Amount amount) {
    auto* entry = touch(owner);
    if (!entry) {
      return Status::kNotFound;
    }
    auto next = common::checked_add(entry->balance, amount);
    if (!next) {
      return Status::kArithmeticError;
    }
    entry->balance = *next;
    return Status::kOk;
  }

  Status debit(const common::Identity& owner, common::Amount amount) {
    auto* entry = touch(owner);
    if (!entry) {
      return Status::kNotFound;
    }
    if (entry->balance < amount) {
      return Status::kInsufficientFunds;
    }
    auto next = common::checked_sub(entry->balance, amount);
    if (!next) {
      return Status::kArithmeticError;
    }
    entry->balance = *next;
    return Status::kOk;
  }

  void commit(ledger::LedgerStore& store) const {
    for (const auto& entry : entries_) {
      store.set_balance(entry.owner, entry.balance);
    }
  }

 private:
  const ledger::LedgerStore& store_;
  std::vector<ledger::UserAccount> entries_;

  ledger::UserAccount* touch(const common::Identity& owner) {
    for (auto& entry : entries_) {
      if (entry.owner == owner) {
        return &entry;
      }
    }
    const auto* account = store_.find_account(owner);
    if (!account) {
      return nullptr;
    }
    if (entries_.size() == kMaxTouchedAccounts) {
      throw std::logic_error("transition touches too many accounts");
    }
    entries_.push_back(*account);
    return &entries_.back();
  }
};

OperationResult transfer_failed(vault::TransferStatus transfer_status) noexcept {
  auto result = reject(Status::kTransferFailed);
  result.transfer_status = transfer_status;
  return result;
}

}  // namespace

const char* to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kInsufficientFunds:
      return "insufficient funds";
    case Status::kUnauthorized:
      return "unauthorized";
    case Status::kArithmeticError:
      return "arithmetic error";
    case Status::kAlreadyExists:
      return "already exists";
    case Status::kTransferFailed:
      return "transfer failed";
    case Status::kNotFound:
      return "account not found";
    case Status::kNotInitialized:
      return "game not initialized";
    case Status::kInvalidVault:
      return "destination is not the game vault";
    case Status::kDuplicateRequest:
      return "duplicate request";
    case Status::kInvalidSignature:
      return "invalid signature";
    case Status::kMalformedRequest:
      return "malformed request";
  }
  return "unknown";
}

OperationResult reject(Status status) noexcept {
  OperationResult result;
  result.status = status;
  switch (status) {
    case Status::kOk:
      break;
    case Status::kInsufficientFunds:
      result.reject_code = kRejectCodeInsufficientFunds;
      break;
    case Status::kUnauthorized:
      result.reject_code = kRejectCodeUnauthorized;
      break;
    case Status::kArithmeticError:
      result.reject_code = kRejectCodeArithmetic;
      break;
    case Status::kAlreadyExists:
      result.reject_code = kRejectCodeAlreadyExists;
      break;
    case Status::kTransferFailed:
      result.reject_code = kRejectCodeTransferFailed;
      break;
    case Status::kNotFound:
      result.reject_code = kRejectCodeNotFound;
      break;
    case Status::kNotInitialized:
      result.reject_code = kRejectCodeNotInitialized;
      break;
    case Status::kInvalidVault:
      result.reject_code = kRejectCodeInvalidVault;
      break;
    case Status::kDuplicateRequest:
      result.reject_code = kRejectCodeDuplicate;
      break;
    case Status::kInvalidSignature:
      result.reject_code = kRejectCodeInvalidSignature;
      break;
    case Status::kMalformedRequest:
      result.reject_code = kRejectCodeMalformed;
      break;
  }
  return result;
}

SettlementEngine::SettlementEngine(EngineConfig config, ledger::LedgerStore& store, vault::TransferService& vault)
    : config_(std::move(config)), store_(store), vault_(vault) {}

OperationResult SettlementEngine::apply(const common::Identity& caller, const Envelope& envelope) {
  if (envelope.idempotency_key && store_.has_applied(*envelope.idempotency_key)) {
    return reject(Status::kDuplicateRequest);
  }

  auto result = apply(caller, envelope.request);
  if (result.ok() && envelope.idempotency_key) {
    store_.mark_applied(*envelope.idempotency_key);
  }
  return result;
}

OperationResult SettlementEngine::apply(const common::Identity& caller, const Request& request) {
  return std::visit(
      [&](const auto& body) -> OperationResult {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, Initialize>) {
          return initialize(caller, body);
        } else if constexpr (std::is_same_v<T, CreateUserAccount>) {
          return create_user_account(caller, body);
        } else if constexpr (std::is_same_v<T, Deposit>) {
          return deposit(caller, body);
        } else if constexpr (std::is_same_v<T, Withdraw>) {
          return withdraw(caller, body);
        } else if constexpr (std::is_same_v<T, AttestOutcome>) {
          return attest_outcome(caller, body);
        } else if constexpr (std::is_same_v<T, AdminDeposit>) {
          return admin_deposit(caller, body);
        } else {
          return admin_withdraw(caller, body);
        }
      },
      request);
}

OperationResult SettlementEngine::initialize(const common::Identity& caller, const Initialize& request) {
  if (caller != request.authority) {
    return reject(Status::kUnauthorized);
  }
  if (store_.has_game()) {
    return reject(Status::kAlreadyExists);
  }

  const auto game_id = auth::derive_game_identity(config_.program_id, request.seed);
  if (!store_.create_game(ledger::GameRecord{.bump = request.seed, .authority = request.authority}, game_id)) {
    return reject(Status::kAlreadyExists);
  }
  return {};
}

OperationResult SettlementEngine::create_user_account(const common::Identity& caller,
                                                      const CreateUserAccount& request) {
  if (caller != request.user) {
    return reject(Status::kUnauthorized);
  }
  if (!store_.create_account(request.user)) {
    return reject(Status::kAlreadyExists);
  }
  return {};
}

OperationResult SettlementEngine::deposit(const common::Identity& caller, const Deposit& request) {
  if (!store_.has_game()) {
    return reject(Status::kNotInitialized);
  }
  if (caller != request.user) {
    return reject(Status::kUnauthorized);
  }
  return credit_from_vault_transfer(caller, request.user, request.amount, request.source, request.destination);
}

OperationResult SettlementEngine::withdraw(const common::Identity& caller, const Withdraw& request) {
  const auto* game = store_.game();
  if (!game) {
    return reject(Status::kNotInitialized);
  }
  if (caller != request.user) {
    return reject(Status::kUnauthorized);
  }
  return debit_to_vault_transfer(*game, request.user, request.amount, request.destination);
}

OperationResult SettlementEngine::attest_outcome(const common::Identity& caller, const AttestOutcome& request) {
  const auto* game = store_.game();
  if (!game) {
    return reject(Status::kNotInitialized);
  }
  if (caller != game->authority) {
    return reject(Status::kUnauthorized);
  }

  const common::Amount fee = settlement_fee(request.stake);
  const common::Amount net = request.stake - fee;

  StagedBalances staged(store_);
  if (const auto winner = winner_of(request.outcome)) {
    if (const auto status = staged.credit(*winner, net); status != Status::kOk) {
      return reject(status);
    }
  }
  if (const auto loser = loser_of(request.outcome)) {
    if (const auto status = staged.debit(*loser, request.stake); status != Status::kOk) {
      return reject(status);
    }
  }
  if (const auto status = staged.credit(*store_.operating_owner(), fee); status != Status::kOk) {
    return reject(status);
  }

  staged.commit(store_);

  OperationResult result;
  result.fee = fee;
  result.net = net;
  return result;
}

OperationResult SettlementEngine::admin_deposit(const common::Identity& caller, const AdminDeposit& request) {
  const auto* game = store_.game();
  if (!game) {
    return reject(Status::kNotInitialized);
  }
  if (caller != game->authority) {
    return reject(Status::kUnauthorized);
  }
  const auto& game_id = *store_.operating_owner();
  return credit_from_vault_transfer(caller, game_id, request.amount, request.source, game_id);
}

OperationResult SettlementEngine::admin_withdraw(const common::Identity& caller, const AdminWithdraw& request) {
  const auto* game = store_.game();
  if (!game) {
    return reject(Status::kNotInitialized);
  }
  if (caller != game->authority) {
    return reject(Status::kUnauthorized);
  }
  return debit_to_vault_transfer(*game, *store_.operating_owner(), request.amount, request.destination);
}

std::optional<common::Identity> SettlementEngine::game_identity() const {
  if (const auto* owner = store_.operating_owner()) {
    return *owner;
  }
  return std::nullopt;
}

auth::VaultCredential SettlementEngine::vault_credential(const ledger::GameRecord& game) const {
  return auth::VaultCredential(config_.program_id, game.bump);
}

OperationResult SettlementEngine::credit_from_vault_transfer(const common::Identity& caller,
                                                             const common::Identity& account_owner,
                                                             common::Amount amount,
                                                             const common::Identity& source,
                                                             const common::Identity& destination) {
  if (destination != *store_.operating_owner()) {
    return reject(Status::kInvalidVault);
  }

  StagedBalances staged(store_);
  if (const auto status = staged.credit(account_owner, amount); status != Status::kOk) {
    return reject(status);
  }

  const auto transfer_status = vault_.transfer(vault::TransferRequest{
      .amount = amount,
      .source = source,
      .destination = destination,
      .signer = caller,
      .credential = std::nullopt,
  });
  if (transfer_status != vault::TransferStatus::kCompleted) {
    return transfer_failed(transfer_status);
  }

  staged.commit(store_);
  return {};
}

OperationResult SettlementEngine::debit_to_vault_transfer(const ledger::GameRecord& game,
                                                          const common::Identity& account_owner,
                                                          common::Amount amount,
                                                          const common::Identity& destination) {
  // Paying out to the vault itself would move no tokens.
  if (destination == *store_.operating_owner()) {
    return reject(Status::kInvalidVault);
  }

  StagedBalances staged(store_);
  if (const auto status = staged.debit(account_owner, amount); status != Status::kOk) {
    return reject(status);
  }

  const auto credential = vault_credential(game);
  const auto transfer_status = vault_.transfer(vault::TransferRequest{
      .amount = amount,
      .source = *store_.operating_owner(),
      .destination = destination,
      .signer = credential.signer(),
      .credential = credential,
  });
  if (transfer_status != vault::TransferStatus::kCompleted) {
    return transfer_failed(transfer_status);
  }

  staged.commit(store_);
  return {};
}

Reconciliation reconcile(const ledger::LedgerStore& store, common::Amount custodied) {
  Reconciliation report;
  report.custodied = custodied;
  if (auto total = store.total_balance()) {
    report.liabilities = *total;
  } else {
    report.liabilities = std::numeric_limits<common::Amount>::max();
    report.liabilities_overflow = true;
  }
  return report;
}

}  // namespace settlement
}  // namespace wagerledger
