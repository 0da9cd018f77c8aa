#include "wagerledger/settlement/transfer_history.hpp"

#include <type_traits>
#include <variant>

#include "wagerledger/settlement/request_codec.hpp"
#include "wagerledger/wal/journal.hpp"

namespace wagerledger {
namespace settlement {

const char* to_string(TransferDirection direction) noexcept {
  switch (direction) {
    case TransferDirection::kDeposit:
      return "deposit";
    case TransferDirection::kWithdraw:
      return "withdraw";
  }
  return "unknown";
}

std::vector<TransferRecord> transfer_history(const std::filesystem::path& wal_path, const common::Identity& owner) {
  std::vector<TransferRecord> history;
  if (!std::filesystem::exists(wal_path)) {
    return history;
  }

  wal::Reader reader(wal_path);
  wal::Record record;
  while (reader.next(record)) {
    const auto entry = codec::decode_journal_entry(record.payload);
    TransferRecord row{.sequence = record.header.sequence, .idempotency_key = entry.envelope.idempotency_key};

    const bool matched = std::visit(
        [&](const auto& body) {
          using T = std::decay_t<decltype(body)>;
          if constexpr (std::is_same_v<T, Deposit>) {
            row.direction = TransferDirection::kDeposit;
            row.amount = body.amount;
            row.token_account = body.source;
            return body.user == owner;
          } else if constexpr (std::is_same_v<T, Withdraw>) {
            row.direction = TransferDirection::kWithdraw;
            row.amount = body.amount;
            row.token_account = body.destination;
            return body.user == owner;
          } else if constexpr (std::is_same_v<T, AdminDeposit>) {
            row.direction = TransferDirection::kDeposit;
            row.amount = body.amount;
            row.token_account = body.source;
            row.admin = true;
            return entry.caller == owner;
          } else if constexpr (std::is_same_v<T, AdminWithdraw>) {
            row.direction = TransferDirection::kWithdraw;
            row.amount = body.amount;
            row.token_account = body.destination;
            row.admin = true;
            return entry.caller == owner;
          } else {
            return false;
          }
        },
        entry.envelope.request);

    if (matched) {
      history.push_back(row);
    }
  }
  return history;
}

}  // namespace settlement
}  // namespace wagerledger
