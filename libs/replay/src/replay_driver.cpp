#include "wagerledger/replay/replay_driver.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace wagerledger {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

Driver::Summary Driver::execute() {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }

  Summary summary;
  if (const auto snap = snapshot_store_.latest()) {
    summary.snapshot_sequence = snap->sequence;
    summary.last_sequence = snap->sequence;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, snap->payload);
    }
  }

  if (!std::filesystem::exists(wal_path_)) {
    return summary;
  }

  wal::Reader reader(wal_path_);
  reader.seek_sequence(summary.snapshot_sequence + 1);

  std::uint64_t expected = summary.snapshot_sequence + 1;
  wal::Record record;
  while (reader.next(record)) {
    const auto sequence = record.header.sequence;
    if (sequence != expected) {
      throw std::runtime_error("journal gap: expected sequence " + std::to_string(expected) + ", found " +
                               std::to_string(sequence));
    }
    event_handler_(record);
    ++summary.replayed;
    summary.last_sequence = sequence;
    ++expected;
  }
  return summary;
}

}  // namespace replay
}  // namespace wagerledger
