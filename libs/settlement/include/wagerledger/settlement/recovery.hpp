#pragma once

#include <filesystem>

#include "wagerledger/ledger/ledger_store.hpp"
#include "wagerledger/replay/replay_driver.hpp"
#include "wagerledger/settlement/settlement_engine.hpp"
#include "wagerledger/snapshot/snapshot_store.hpp"
#include "wagerledger/wal/journal.hpp"

namespace wagerledger {
namespace settlement {

// Rebuilds `store` from the latest snapshot plus the journal records after
// it. Journalled requests are re-run through the engine against a vault that
// accepts every transfer. Throws if a journalled request no longer applies.
replay::Driver::Summary restore(ledger::LedgerStore& store,
                                const EngineConfig& config,
                                const std::filesystem::path& snapshot_dir,
                                const std::filesystem::path& wal_path);

// Syncs the journal, then persists the store tagged with the last journal
// sequence it reflects.
void take_snapshot(const ledger::LedgerStore& store, wal::Writer& journal, snapshot::Store& snapshots);

}  // namespace settlement
}  // namespace wagerledger
