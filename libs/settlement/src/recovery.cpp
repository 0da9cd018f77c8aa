#include "wagerledger/settlement/recovery.hpp"

#include <stdexcept>
#include <string>

#include "wagerledger/settlement/request_codec.hpp"
#include "wagerledger/vault/transfer_service.hpp"

namespace wagerledger {
namespace settlement {

replay::Driver::Summary restore(ledger::LedgerStore& store,
                                const EngineConfig& config,
                                const std::filesystem::path& snapshot_dir,
                                const std::filesystem::path& wal_path) {
  store.clear();

  vault::ReplayVault vault;
  SettlementEngine engine(config, store, vault);

  replay::Driver driver;
  driver.configure(snapshot_dir, wal_path);
  driver.set_snapshot_handler([&](std::uint64_t, std::span<const std::byte> payload) {
    ledger::decode_store(payload, store);
  });
  driver.set_event_handler([&](const wal::Record& record) {
    const auto entry = codec::decode_journal_entry(record.payload);
    const auto result = engine.apply(entry.caller, entry.envelope);
    if (!result.ok()) {
      throw std::runtime_error("journal replay diverged at sequence " +
                               std::to_string(record.header.sequence) + ": " + to_string(result.status));
    }
  });
  return driver.execute();
}

void take_snapshot(const ledger::LedgerStore& store, wal::Writer& journal, snapshot::Store& snapshots) {
  journal.sync();
  const auto image = ledger::encode_store(store);
  snapshots.persist(journal.last_sequence(), image);
}

}  // namespace settlement
}  // namespace wagerledger
