#include "wagerledger/settlement/requests.hpp"

namespace wagerledger {
namespace settlement {

const char* to_string(OperationKind kind) noexcept {
  switch (kind) {
    case OperationKind::kInitialize:
      return "initialize";
    case OperationKind::kCreateUserAccount:
      return "create-user-account";
    case OperationKind::kDeposit:
      return "deposit";
    case OperationKind::kWithdraw:
      return "withdraw";
    case OperationKind::kAttestOutcome:
      return "attest-outcome";
    case OperationKind::kAdminDeposit:
      return "admin-deposit";
    case OperationKind::kAdminWithdraw:
      return "admin-withdraw";
  }
  return "unknown";
}

OperationKind kind_of(const Request& request) noexcept {
  // Variant alternatives are declared in OperationKind order.
  return static_cast<OperationKind>(request.index() + 1);
}

}  // namespace settlement
}  // namespace wagerledger
