#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wagerledger {
namespace config {

struct GameConfig {
  // Hex of the 32-byte program id the vault seed is derived under.
  std::string program_id{"7475726e696e672d67616d652d7661756c742d70726f6772616d2d6964000001"};
  std::int64_t vault_seed{255};
  // Hex identity that the daemon's `init` command uses when none is given.
  std::string authority{};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/wagerledger/ledger.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/wagerledger/snapshots"};
  std::size_t wal_flush_threshold{128};
  std::uint32_t snapshot_interval{1000};
};

struct TelemetryConfig {
  bool enabled{true};
  std::size_t buffer_size{1024};
};

struct LedgerConfig {
  GameConfig game;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LedgerConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LedgerConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace wagerledger
