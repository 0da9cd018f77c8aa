#include "test_persistence.hpp"

#include <array>
#include <bit>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>

#include "test_support.hpp"
#include "wagerledger/common/byte_codec.hpp"
#include "wagerledger/replay/replay_driver.hpp"
#include "wagerledger/settlement/gateway.hpp"
#include "wagerledger/settlement/recovery.hpp"
#include "wagerledger/settlement/request_codec.hpp"
#include "wagerledger/settlement/transfer_history.hpp"
#include "wagerledger/snapshot/snapshot_store.hpp"
#include "wagerledger/wal/journal.hpp"

namespace wagerledger::tests {

namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const char* name) {
  const auto dir = fs::temp_directory_path() / "wagerledger_tests" / name;
  fs::remove_all(dir);
  return dir;
}

std::array<std::byte, 4> payload_of(std::uint32_t value) {
  return std::bit_cast<std::array<std::byte, 4>>(value);
}

}  // namespace

void test_journal_roundtrip() {
  const auto dir = fresh_dir("journal_roundtrip");
  const auto wal_path = dir / "ledger.wal";

  {
    wal::Writer writer(wal_path, 128);
    assert(writer.next_sequence() == 1);
    assert(writer.append(payload_of(10)) == 1);
    assert(writer.append(payload_of(20)) == 2);
    writer.sync();
  }

  {
    // Reopening continues the numbering.
    wal::Writer writer(wal_path, 128);
    assert(writer.last_sequence() == 2);
    assert(writer.append(payload_of(30)) == 3);
    assert(writer.append({}) == 4);
  }

  wal::Reader reader(wal_path);
  wal::Record record;
  std::uint32_t expected[] = {10, 20, 30};
  for (std::uint64_t seq = 1; seq <= 3; ++seq) {
    assert(reader.next(record));
    assert(record.header.sequence == seq);
    assert(record.payload.size() == 4);
    assert(std::bit_cast<std::uint32_t>(std::array<std::byte, 4>{
               record.payload[0], record.payload[1], record.payload[2], record.payload[3]}) == expected[seq - 1]);
  }
  assert(reader.next(record));
  assert(record.payload.empty());
  assert(!reader.next(record));

  wal::Reader seeking(wal_path);
  seeking.seek_sequence(3);
  assert(seeking.next(record));
  assert(record.header.sequence == 3);

  fs::remove_all(dir);
}

void test_journal_corruption() {
  const auto dir = fresh_dir("journal_corruption");
  const auto wal_path = dir / "ledger.wal";
  {
    wal::Writer writer(wal_path, 0);
    writer.append(payload_of(1));
    writer.append(payload_of(2));
  }

  // Flip the first payload byte of the second record.
  {
    std::fstream file(wal_path, std::ios::binary | std::ios::in | std::ios::out);
    const auto offset = static_cast<std::streamoff>(2 * sizeof(wal::RecordHeader) + 4);
    file.seekp(offset);
    file.put(static_cast<char>(0x7f));
    assert(file.good());
  }

  wal::Reader reader(wal_path);
  wal::Record record;
  assert(reader.next(record));
  bool threw = false;
  try {
    reader.next(record);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // Mid-file corruption is not repaired on open.
  threw = false;
  try {
    wal::Writer writer(wal_path);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  fs::remove_all(dir);
}

void test_journal_torn_tail() {
  const auto dir = fresh_dir("journal_torn_tail");
  const auto wal_path = dir / "ledger.wal";
  {
    wal::Writer writer(wal_path, 0);
    writer.append(payload_of(1));
    writer.append(payload_of(2));
  }
  const auto intact_size = fs::file_size(wal_path);

  // Half of a third record: a full header but only part of its payload.
  {
    wal::Writer writer(wal_path, 0);
    writer.append(payload_of(3));
  }
  fs::resize_file(wal_path, intact_size + sizeof(wal::RecordHeader) + 2);

  {
    wal::Reader reader(wal_path);
    wal::Record record;
    assert(reader.next(record));
    assert(reader.next(record));
    bool torn = false;
    try {
      reader.next(record);
    } catch (const wal::TornRecord&) {
      torn = true;
    }
    assert(torn);
    assert(reader.intact_bytes() == intact_size);
  }

  {
    wal::Writer writer(wal_path, 0);
    assert(writer.repaired_bytes() == sizeof(wal::RecordHeader) + 2);
    assert(fs::file_size(wal_path) == intact_size);
    assert(writer.append(payload_of(4)) == 3);
  }

  // A lone partial header is cut off as well.
  {
    std::ofstream tail(wal_path, std::ios::binary | std::ios::app);
    tail.put('\x52');
  }
  wal::Writer writer(wal_path, 0);
  assert(writer.repaired_bytes() == 1);
  assert(writer.last_sequence() == 3);

  fs::remove_all(dir);
}

void test_snapshot_store() {
  const auto dir = fresh_dir("snapshot_store");
  snapshot::Store store(dir);
  assert(fs::exists(dir));
  assert(store.directory() == dir);
  assert(!store.latest().has_value());

  store.persist(5, payload_of(42));
  store.persist(9, payload_of(43));
  const auto snap = store.latest();
  assert(snap.has_value());
  assert(snap->sequence == 9);
  assert(snap->payload.size() == 4);
  assert(snap->payload[0] == payload_of(43)[0]);
  assert(!fs::exists(dir / "ledger.snap.tmp"));

  // A temp file left by an interrupted write is replaced whole.
  {
    std::ofstream stale(dir / "ledger.snap.tmp", std::ios::binary | std::ios::trunc);
    stale << "leftover bytes from an interrupted snapshot write";
  }
  assert(store.latest()->sequence == 9);
  store.persist(11, payload_of(44));
  assert(store.latest()->sequence == 11);
  assert(!fs::exists(dir / "ledger.snap.tmp"));
  assert(fs::file_size(dir / "ledger.snap") == 24 + 4);

  // A flipped payload byte fails the checksum.
  {
    std::fstream file(dir / "ledger.snap", std::ios::binary | std::ios::in | std::ios::out);
    file.seekp(-1, std::ios::end);
    file.put(static_cast<char>(0x7f));
  }
  bool corrupt = false;
  try {
    (void)store.latest();
  } catch (const std::runtime_error&) {
    corrupt = true;
  }
  assert(corrupt);

  {
    std::ofstream garbage(dir / "ledger.snap", std::ios::binary | std::ios::trunc);
    garbage << "not a snapshot header at all, really";
  }
  bool threw = false;
  try {
    (void)store.latest();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  snapshot::Store unset;
  threw = false;
  try {
    unset.persist(1, payload_of(1));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  fs::remove_all(dir);
}

void test_replay_detects_gap() {
  const auto dir = fresh_dir("replay_gap");
  const auto wal_path = dir / "ledger.wal";
  {
    wal::Writer writer(wal_path, 0);
    writer.append(payload_of(1));
  }

  // Hand-written record that skips sequence 2.
  {
    const auto payload = payload_of(3);
    wal::RecordHeader header;
    header.sequence = 3;
    header.payload_size = static_cast<std::uint32_t>(payload.size());
    header.checksum = common::codec::checksum32(payload);
    std::ofstream out(wal_path, std::ios::binary | std::ios::app);
    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  }

  replay::Driver driver;
  driver.configure(dir / "snapshots", wal_path);
  std::uint64_t seen = 0;
  driver.set_event_handler([&](const wal::Record&) { ++seen; });
  bool threw = false;
  try {
    (void)driver.execute();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(seen == 1);

  // Starting after the gap is fine.
  snapshot::Store snapshots(dir / "snapshots");
  snapshots.persist(2, payload_of(0));
  std::uint64_t restored_from = 0;
  driver.set_snapshot_handler([&](std::uint64_t sequence, std::span<const std::byte>) { restored_from = sequence; });
  seen = 0;
  const auto summary = driver.execute();
  assert(restored_from == 2);
  assert(seen == 1);
  assert(summary.last_sequence == 3);

  fs::remove_all(dir);
}

void test_restore_from_snapshot_and_journal() {
  const auto dir = fresh_dir("restore");
  const auto wal_path = dir / "ledger.wal";
  const auto snapshot_dir = dir / "snapshots";
  const auto alice = make_identity(0x10);
  const auto bob = make_identity(0x11);
  const auto key = common::idempotency_key_from_hex("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa").value();

  Harness h;
  {
    wal::Writer journal(wal_path, 0);
    snapshot::Store snapshots(snapshot_dir);
    settlement::Gateway gateway(h.engine, journal);

    assert(gateway.submit(h.authority, {.request = settlement::Initialize{.seed = Harness::kSeed,
                                                                          .authority = h.authority}})
               .ok());
    h.vault.open_account(h.game_id(), h.game_id());
    for (const auto& user : {alice, bob}) {
      assert(gateway.submit(user, {.request = settlement::CreateUserAccount{.user = user}}).ok());
      h.vault.open_account(token_account(user[0]), user);
      h.vault.mint(token_account(user[0]), 1'000);
      assert(gateway
                 .submit(user, {.request = settlement::Deposit{.amount = 1'000,
                                                               .user = user,
                                                               .source = token_account(user[0]),
                                                               .destination = h.game_id()}})
                 .ok());
    }

    settlement::take_snapshot(h.store, journal, snapshots);
    assert(snapshots.latest()->sequence == 5);

    assert(gateway
               .submit(h.authority,
                       {.request = settlement::AttestOutcome{
                            .stake = 300, .outcome = settlement::WinnerAndLoser{.winner = alice, .loser = bob}},
                        .idempotency_key = key})
               .ok());
    assert(gateway
               .submit(bob, {.request = settlement::Withdraw{
                                 .amount = 100, .user = bob, .destination = token_account(bob[0])}})
               .ok());
    // Rejected, so never journalled.
    assert(!gateway
                .submit(bob, {.request = settlement::Withdraw{
                                  .amount = 10'000, .user = bob, .destination = token_account(bob[0])}})
                .ok());
    journal.sync();
  }

  ledger::LedgerStore restored;
  assert(restored.create_account(make_identity(0x55)));
  const auto summary = settlement::restore(
      restored, settlement::EngineConfig{.program_id = h.program_id}, snapshot_dir, wal_path);
  assert(summary.snapshot_sequence == 5);
  assert(summary.replayed == 2);
  assert(summary.last_sequence == 7);

  assert(restored.find_account(make_identity(0x55)) == nullptr);
  assert(restored.game()->authority == h.authority);
  assert(restored.account_count() == h.store.account_count());
  for (const auto& account : h.store.accounts()) {
    assert(restored.find_account(account.owner)->balance == account.balance);
  }
  assert(restored.find_account(alice)->balance == 1'270);
  assert(restored.find_account(bob)->balance == 600);
  assert(restored.has_applied(key));

  // Without a snapshot the whole journal is replayed.
  fs::remove_all(snapshot_dir);
  ledger::LedgerStore from_journal;
  const auto full = settlement::restore(
      from_journal, settlement::EngineConfig{.program_id = h.program_id}, snapshot_dir, wal_path);
  assert(full.replayed == 7);
  assert(from_journal.find_account(h.game_id())->balance == 30);

  // A journalled request that no longer applies stops recovery.
  {
    wal::Writer journal(wal_path, 0);
    const auto payload = settlement::codec::encode(settlement::codec::JournalEntry{
        .caller = alice,
        .envelope = {.request = settlement::Withdraw{
                         .amount = 5'000, .user = alice, .destination = token_account(alice[0])}},
    });
    assert(journal.append(payload) == 8);
  }
  ledger::LedgerStore diverged;
  bool threw = false;
  try {
    settlement::restore(diverged, settlement::EngineConfig{.program_id = h.program_id}, snapshot_dir, wal_path);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  fs::remove_all(dir);
}

void test_transfer_history() {
  const auto dir = fresh_dir("transfer_history");
  const auto wal_path = dir / "ledger.wal";
  const auto alice = make_identity(0x10);
  const auto bob = make_identity(0x11);
  const auto key = common::idempotency_key_from_hex("0123456789abcdef0123456789abcdef").value();

  assert(settlement::transfer_history(wal_path, alice).empty());

  Harness h;
  h.bootstrap();
  h.add_user(alice, 1'000);
  h.add_user(bob, 1'000);
  const auto admin_tokens = token_account(h.authority[0]);
  h.vault.mint(admin_tokens, 2'000);

  {
    wal::Writer journal(wal_path);
    settlement::Gateway gateway(h.engine, journal);

    const auto deposit = [&](const common::Identity& user, common::Amount amount) {
      return gateway.submit(user, {.request = settlement::Deposit{.amount = amount,
                                                                  .user = user,
                                                                  .source = token_account(user[0]),
                                                                  .destination = h.game_id()}});
    };
    assert(deposit(alice, 500).ok());
    assert(deposit(bob, 300).ok());
    assert(gateway
               .submit(alice, {.request = settlement::Withdraw{
                                   .amount = 9'999, .user = alice, .destination = token_account(alice[0])}})
               .status == settlement::Status::kInsufficientFunds);
    assert(gateway
               .submit(alice, {.request = settlement::Withdraw{
                                   .amount = 200, .user = alice, .destination = token_account(alice[0])},
                               .idempotency_key = key})
               .ok());
    assert(gateway
               .submit(h.authority,
                       {.request = settlement::AttestOutcome{
                            .stake = 100, .outcome = settlement::WinnerAndLoser{.winner = alice, .loser = bob}}})
               .ok());
    assert(gateway.submit(h.authority, {.request = settlement::AdminDeposit{.amount = 1'000, .source = admin_tokens}})
               .ok());
    assert(gateway
               .submit(h.authority, {.request = settlement::AdminWithdraw{.amount = 50, .destination = admin_tokens}})
               .ok());
    // Buffered records are only visible to the history once flushed.
    journal.flush();

    const auto alice_rows = settlement::transfer_history(wal_path, alice);
    assert(alice_rows.size() == 2);
    assert(alice_rows[0].sequence == 1);
    assert(alice_rows[0].direction == settlement::TransferDirection::kDeposit);
    assert(alice_rows[0].amount == 500);
    assert(alice_rows[0].token_account == token_account(alice[0]));
    assert(!alice_rows[0].admin);
    assert(!alice_rows[0].idempotency_key);
    assert(alice_rows[1].sequence == 3);
    assert(alice_rows[1].direction == settlement::TransferDirection::kWithdraw);
    assert(alice_rows[1].amount == 200);
    assert(alice_rows[1].idempotency_key == key);
  }

  // Settlement moves ledger balances only, so it is not a transfer.
  const auto bob_rows = settlement::transfer_history(wal_path, bob);
  assert(bob_rows.size() == 1);
  assert(bob_rows[0].sequence == 2);
  assert(bob_rows[0].amount == 300);

  const auto admin_rows = settlement::transfer_history(wal_path, h.authority);
  assert(admin_rows.size() == 2);
  assert(admin_rows[0].sequence == 5);
  assert(admin_rows[0].admin);
  assert(admin_rows[0].direction == settlement::TransferDirection::kDeposit);
  assert(admin_rows[0].amount == 1'000);
  assert(admin_rows[1].sequence == 6);
  assert(admin_rows[1].direction == settlement::TransferDirection::kWithdraw);
  assert(admin_rows[1].token_account == admin_tokens);

  assert(settlement::transfer_history(wal_path, make_identity(0x99)).empty());
  assert(std::string{settlement::to_string(settlement::TransferDirection::kWithdraw)} == "withdraw");

  fs::remove_all(dir);
}

}  // namespace wagerledger::tests
