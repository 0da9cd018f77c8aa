#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>

#include "wagerledger/snapshot/snapshot_store.hpp"
#include "wagerledger/wal/journal.hpp"

namespace wagerledger {
namespace replay {

// Feeds the latest snapshot, then every journal record after it, to the
// installed handlers. Throws if the journal skips a sequence number.
class Driver {
 public:
  using SnapshotHandler = std::function<void(std::uint64_t, std::span<const std::byte>)>;
  using EventHandler = std::function<void(const wal::Record&)>;

  struct Summary {
    std::uint64_t snapshot_sequence{0};
    std::uint64_t replayed{0};
    std::uint64_t last_sequence{0};
  };

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_event_handler(EventHandler handler);
  Summary execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  EventHandler event_handler_{};
};

}  // namespace replay
}  // namespace wagerledger
