#include "test_config.hpp"

#include <algorithm>
#include <cassert>
#include <string>

#include "wagerledger/config/config_loader.hpp"

namespace wagerledger::tests {

namespace {
bool has_error(const config::LoadResult& result, const std::string& field) {
  return std::any_of(result.errors.begin(), result.errors.end(),
                     [&](const config::ValidationError& error) { return error.field == field; });
}
}  // namespace

void test_config_defaults() {
  const auto generated = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(generated.success);
  assert(generated.errors.empty());

  const config::LedgerConfig defaults;
  assert(generated.config.game.program_id == defaults.game.program_id);
  assert(generated.config.game.vault_seed == defaults.game.vault_seed);
  assert(generated.config.persistence.wal_path == defaults.persistence.wal_path);
  assert(generated.config.persistence.snapshot_interval == defaults.persistence.snapshot_interval);
  assert(generated.config.telemetry.enabled);

  // Missing sections fall back to defaults.
  const auto partial = config::ConfigLoader::load_from_string(R"(
[game]
vault_seed = 3

[persistence]
wal_path = "/tmp/wl/ledger.wal"
)");
  assert(partial.success);
  assert(partial.config.game.vault_seed == 3);
  assert(partial.config.persistence.wal_path == "/tmp/wl/ledger.wal");
  assert(partial.config.persistence.snapshot_dir == defaults.persistence.snapshot_dir);
  assert(partial.config.telemetry.buffer_size == defaults.telemetry.buffer_size);

  const auto missing = config::ConfigLoader::load("/nonexistent/wagerledger.toml");
  assert(!missing.success);
  assert(!missing.raw_error.empty());
}

void test_config_validation() {
  const auto invalid = config::ConfigLoader::load_from_string(R"(
[game]
program_id = "abc"
vault_seed = 256
authority = "zz"

[persistence]
snapshot_interval = 0

[telemetry]
enabled = true
buffer_size = 0
)");
  assert(!invalid.success);
  assert(invalid.raw_error.empty());
  assert(has_error(invalid, "game.program_id"));
  assert(has_error(invalid, "game.vault_seed"));
  assert(has_error(invalid, "game.authority"));
  assert(has_error(invalid, "persistence.snapshot_interval"));
  assert(has_error(invalid, "telemetry.buffer_size"));
  assert(!has_error(invalid, "persistence.wal_path"));

  // An empty buffer is fine when telemetry is off.
  const auto quiet = config::ConfigLoader::load_from_string(R"(
[game]
authority = "0101010101010101010101010101010101010101010101010101010101010101"

[telemetry]
enabled = false
buffer_size = 0
)");
  assert(quiet.success);

  // Negative counts are out of range rather than wrapped to huge values.
  const auto negative = config::ConfigLoader::load_from_string(R"(
[persistence]
wal_flush_threshold = -64
snapshot_interval = -1

[telemetry]
buffer_size = -5
)");
  assert(!negative.success);
  assert(has_error(negative, "persistence.wal_flush_threshold"));
  assert(has_error(negative, "persistence.snapshot_interval"));
  assert(has_error(negative, "telemetry.buffer_size"));
  assert(negative.config.persistence.snapshot_interval == config::PersistenceConfig{}.snapshot_interval);
  assert(negative.config.telemetry.buffer_size == config::TelemetryConfig{}.buffer_size);

  // snapshot_interval is 32-bit.
  const auto wide = config::ConfigLoader::load_from_string(R"(
[persistence]
snapshot_interval = 4294967296
)");
  assert(!wide.success);
  assert(has_error(wide, "persistence.snapshot_interval"));

  const auto broken = config::ConfigLoader::load_from_string("[game\nvault_seed = ");
  assert(!broken.success);
  assert(!broken.raw_error.empty());
}

}  // namespace wagerledger::tests
