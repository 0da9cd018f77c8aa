#include "wagerledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

// Counts are read as int64 by toml++; anything outside T's range is reported
// against `field` and the default is kept.
template <typename T>
T get_count_or(const toml::table& tbl,
               std::string_view key,
               T default_val,
               const char* field,
               std::vector<ValidationError>& errors) {
  const auto raw = get_int_or(tbl, key, static_cast<std::int64_t>(default_val));
  constexpr auto kMax = std::numeric_limits<T>::max();
  if (raw < 0 || static_cast<std::uint64_t>(raw) > kMax) {
    errors.push_back({field, "must be between 0 and " + std::to_string(kMax)});
    return default_val;
  }
  return static_cast<T>(raw);
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

GameConfig parse_game(const toml::table& root) {
  GameConfig cfg;
  if (auto* game = root["game"].as_table()) {
    cfg.program_id = get_str_or(*game, "program_id", cfg.program_id);
    cfg.vault_seed = get_int_or(*game, "vault_seed", cfg.vault_seed);
    cfg.authority = get_str_or(*game, "authority", cfg.authority);
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root, std::vector<ValidationError>& errors) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.wal_flush_threshold = get_count_or(*persistence, "wal_flush_threshold", cfg.wal_flush_threshold,
                                           "persistence.wal_flush_threshold", errors);
    cfg.snapshot_interval =
        get_count_or(*persistence, "snapshot_interval", cfg.snapshot_interval, "persistence.snapshot_interval", errors);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root, std::vector<ValidationError>& errors) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
    cfg.buffer_size = get_count_or(*telemetry, "buffer_size", cfg.buffer_size, "telemetry.buffer_size", errors);
  }
  return cfg;
}

LedgerConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  LedgerConfig cfg;
  cfg.game = parse_game(root);
  cfg.persistence = parse_persistence(root, errors);
  cfg.telemetry = parse_telemetry(root, errors);
  return cfg;
}

LoadResult finish(toml::parse_result& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table(), result.errors);
  const auto semantic = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), semantic.begin(), semantic.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  return finish(parse_result);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  return finish(parse_result);
}

std::vector<ValidationError> ConfigLoader::validate(const LedgerConfig& config) {
  std::vector<ValidationError> errors;

  if (!common::identity_from_hex(config.game.program_id)) {
    errors.push_back({"game.program_id", "must be 64 hex characters"});
  }

  if (config.game.vault_seed < 0 || config.game.vault_seed > 255) {
    errors.push_back({"game.vault_seed", "must be between 0 and 255"});
  }

  if (!config.game.authority.empty() && !common::identity_from_hex(config.game.authority)) {
    errors.push_back({"game.authority", "must be empty or 64 hex characters"});
  }

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  if (config.persistence.snapshot_interval == 0) {
    errors.push_back({"persistence.snapshot_interval", "must be greater than 0"});
  }

  if (config.telemetry.enabled && config.telemetry.buffer_size == 0) {
    errors.push_back({"telemetry.buffer_size", "must be greater than 0 when telemetry is enabled"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# Wager ledger configuration
# Generated default configuration

[game]
program_id = "7475726e696e672d67616d652d7661756c742d70726f6772616d2d6964000001"
vault_seed = 255
authority = ""   # hex identity used by `init` when none is given

[persistence]
wal_path = "/var/lib/wagerledger/ledger.wal"
snapshot_dir = "/var/lib/wagerledger/snapshots"
wal_flush_threshold = 128
snapshot_interval = 1000   # operations between snapshots

[telemetry]
enabled = true
buffer_size = 1024
)";
}

}  // namespace config
}  // namespace wagerledger
