#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "wagerledger/common/byte_codec.hpp"
#include "wagerledger/common/types.hpp"
#include "wagerledger/settlement/requests.hpp"

namespace wagerledger {
namespace settlement {
namespace codec {

// Envelope layout (host byte order, as the journal is read back on the host
// that wrote it):
// [kind:1][has_key:1][key:16]?[body]
//
// Outcome layout inside AttestOutcome:
// [tag:1] tag 0 = none, 1 = winner, 2 = loser, 3 = both; then the identities

namespace detail {

using common::codec::append_array;
using common::codec::append_primitive;
using common::codec::read_array;
using common::codec::read_primitive;

inline common::Identity read_identity(std::span<const std::byte> data, std::size_t& offset) {
  return read_array<common::kIdentitySize>(data, offset);
}

inline void append_body(std::vector<std::byte>& buffer, const Initialize& msg) {
  append_primitive<std::uint8_t>(buffer, msg.seed);
  append_array(buffer, msg.authority);
}

inline void append_body(std::vector<std::byte>& buffer, const CreateUserAccount& msg) {
  append_array(buffer, msg.user);
}

inline void append_body(std::vector<std::byte>& buffer, const Deposit& msg) {
  append_primitive<std::uint64_t>(buffer, msg.amount);
  append_array(buffer, msg.user);
  append_array(buffer, msg.source);
  append_array(buffer, msg.destination);
}

inline void append_body(std::vector<std::byte>& buffer, const Withdraw& msg) {
  append_primitive<std::uint64_t>(buffer, msg.amount);
  append_array(buffer, msg.user);
  append_array(buffer, msg.destination);
}

inline void append_body(std::vector<std::byte>& buffer, const AttestOutcome& msg) {
  append_primitive<std::uint64_t>(buffer, msg.stake);
  append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(msg.outcome.index()));
  if (const auto winner = winner_of(msg.outcome)) {
    append_array(buffer, *winner);
  }
  if (const auto loser = loser_of(msg.outcome)) {
    append_array(buffer, *loser);
  }
}

inline void append_body(std::vector<std::byte>& buffer, const AdminDeposit& msg) {
  append_primitive<std::uint64_t>(buffer, msg.amount);
  append_array(buffer, msg.source);
}

inline void append_body(std::vector<std::byte>& buffer, const AdminWithdraw& msg) {
  append_primitive<std::uint64_t>(buffer, msg.amount);
  append_array(buffer, msg.destination);
}

inline Outcome read_outcome(std::span<const std::byte> data, std::size_t& offset) {
  const auto tag = read_primitive<std::uint8_t>(data, offset);
  switch (tag) {
    case 0:
      return NoParticipants{};
    case 1:
      return WinnerOnly{.winner = read_identity(data, offset)};
    case 2:
      return LoserOnly{.loser = read_identity(data, offset)};
    case 3: {
      WinnerAndLoser both;
      both.winner = read_identity(data, offset);
      both.loser = read_identity(data, offset);
      return both;
    }
    default:
      throw std::runtime_error("unknown outcome tag");
  }
}

}  // namespace detail

inline std::vector<std::byte> encode(const Envelope& envelope) {
  std::vector<std::byte> buffer;
  buffer.reserve(2 + sizeof(common::IdempotencyKey) + 8 + 3 * common::kIdentitySize);
  detail::append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(kind_of(envelope.request)));
  detail::append_primitive<std::uint8_t>(buffer, envelope.idempotency_key ? 1 : 0);
  if (envelope.idempotency_key) {
    detail::append_array(buffer, *envelope.idempotency_key);
  }
  std::visit([&](const auto& body) { detail::append_body(buffer, body); }, envelope.request);
  return buffer;
}

inline Envelope decode_envelope(std::span<const std::byte> data) {
  using namespace detail;

  std::size_t offset = 0;
  Envelope envelope;
  const auto kind = static_cast<OperationKind>(read_primitive<std::uint8_t>(data, offset));
  if (read_primitive<std::uint8_t>(data, offset) != 0) {
    envelope.idempotency_key = read_array<std::tuple_size_v<common::IdempotencyKey>>(data, offset);
  }

  switch (kind) {
    case OperationKind::kInitialize: {
      Initialize msg;
      msg.seed = read_primitive<std::uint8_t>(data, offset);
      msg.authority = read_identity(data, offset);
      envelope.request = msg;
      break;
    }
    case OperationKind::kCreateUserAccount: {
      CreateUserAccount msg;
      msg.user = read_identity(data, offset);
      envelope.request = msg;
      break;
    }
    case OperationKind::kDeposit: {
      Deposit msg;
      msg.amount = read_primitive<std::uint64_t>(data, offset);
      msg.user = read_identity(data, offset);
      msg.source = read_identity(data, offset);
      msg.destination = read_identity(data, offset);
      envelope.request = msg;
      break;
    }
    case OperationKind::kWithdraw: {
      Withdraw msg;
      msg.amount = read_primitive<std::uint64_t>(data, offset);
      msg.user = read_identity(data, offset);
      msg.destination = read_identity(data, offset);
      envelope.request = msg;
      break;
    }
    case OperationKind::kAttestOutcome: {
      AttestOutcome msg;
      msg.stake = read_primitive<std::uint64_t>(data, offset);
      msg.outcome = read_outcome(data, offset);
      envelope.request = msg;
      break;
    }
    case OperationKind::kAdminDeposit: {
      AdminDeposit msg;
      msg.amount = read_primitive<std::uint64_t>(data, offset);
      msg.source = read_identity(data, offset);
      envelope.request = msg;
      break;
    }
    case OperationKind::kAdminWithdraw: {
      AdminWithdraw msg;
      msg.amount = read_primitive<std::uint64_t>(data, offset);
      msg.destination = read_identity(data, offset);
      envelope.request = msg;
      break;
    }
    default:
      throw std::runtime_error("unknown operation kind");
  }

  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes after request");
  }
  return envelope;
}

// Journal payload: [caller:32][envelope]
struct JournalEntry {
  common::Identity caller{};
  Envelope envelope{};
};

inline std::vector<std::byte> encode(const JournalEntry& entry) {
  std::vector<std::byte> buffer;
  detail::append_array(buffer, entry.caller);
  const auto body = encode(entry.envelope);
  buffer.insert(buffer.end(), body.begin(), body.end());
  return buffer;
}

inline JournalEntry decode_journal_entry(std::span<const std::byte> data) {
  std::size_t offset = 0;
  JournalEntry entry;
  entry.caller = detail::read_identity(data, offset);
  entry.envelope = decode_envelope(data.subspan(offset));
  return entry;
}

}  // namespace codec
}  // namespace settlement
}  // namespace wagerledger
