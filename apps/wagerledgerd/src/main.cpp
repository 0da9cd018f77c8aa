#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wagerledger/common/types.hpp"
#include "wagerledger/config/config_loader.hpp"
#include "wagerledger/ledger/ledger_store.hpp"
#include "wagerledger/settlement/gateway.hpp"
#include "wagerledger/settlement/recovery.hpp"
#include "wagerledger/settlement/settlement_engine.hpp"
#include "wagerledger/settlement/transfer_history.hpp"
#include "wagerledger/snapshot/snapshot_store.hpp"
#include "wagerledger/telemetry/telemetry_sink.hpp"
#include "wagerledger/vault/transfer_service.hpp"
#include "wagerledger/wal/journal.hpp"

namespace {

using wagerledger::common::Amount;
using wagerledger::common::Identity;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./wagerledger.toml or generates defaults\n"
            << "\n"
            << "Commands are read from stdin, one per line:\n"
            << "  init [seed [authority]]   (defaults from [game])\n"
            << "  create <user>\n"
            << "  open-token <address> <owner>\n"
            << "  mint <address> <amount>\n"
            << "  deposit <user> <amount> <source_token_account> [key=<32 hex>]\n"
            << "  withdraw <user> <amount> <destination_token_account> [key=<32 hex>]\n"
            << "  attest <authority> <stake> <winner|-> <loser|-> [key=<32 hex>]\n"
            << "  admin-deposit <admin> <amount> <source_token_account> [key=<32 hex>]\n"
            << "  admin-withdraw <admin> <amount> <destination_token_account> [key=<32 hex>]\n"
            << "  balance <owner>\n"
            << "  history <owner>\n"
            << "  audit\n"
            << "  snapshot\n"
            << "  stats\n"
            << "  quit\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./wagerledger.toml",
      "/etc/wagerledger/wagerledger.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/wagerledger/wagerledger.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::optional<Amount> parse_amount(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<Amount>(std::stoull(text));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<Identity> parse_identity(const std::string& text) {
  return wagerledger::common::identity_from_hex(text);
}

// Accepts "key=<32 hex chars>".
std::optional<wagerledger::common::IdempotencyKey> parse_key(const std::string& text) {
  constexpr std::string_view kPrefix = "key=";
  if (text.rfind(kPrefix, 0) != 0) {
    return std::nullopt;
  }
  return wagerledger::common::idempotency_key_from_hex(std::string_view{text}.substr(kPrefix.size()));
}

class CommandShell {
 public:
  CommandShell(const wagerledger::config::LedgerConfig& cfg,
               wagerledger::settlement::EngineConfig engine_cfg,
               wagerledger::ledger::LedgerStore& store,
               wagerledger::wal::Writer& journal,
               wagerledger::snapshot::Store& snapshots,
               wagerledger::telemetry::TelemetrySink* telemetry)
      : cfg_(cfg),
        store_(store),
        journal_(journal),
        snapshots_(snapshots),
        telemetry_(telemetry),
        engine_(std::move(engine_cfg), store, vault_),
        gateway_(engine_, journal, telemetry) {
    open_game_vault();
  }

  // Returns false on `quit`.
  bool execute(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> args;
    for (std::string word; in >> word;) {
      args.push_back(word);
    }
    if (args.empty() || args[0].front() == '#') {
      return true;
    }

    const auto& command = args[0];
    if (command == "quit") {
      return false;
    }
    if (command == "init") {
      init(args);
    } else if (command == "create") {
      create(args);
    } else if (command == "open-token") {
      open_token(args);
    } else if (command == "mint") {
      mint(args);
    } else if (command == "deposit" || command == "withdraw" || command == "admin-deposit" ||
               command == "admin-withdraw") {
      transfer(args);
    } else if (command == "attest") {
      attest(args);
    } else if (command == "balance") {
      balance(args);
    } else if (command == "history") {
      history(args);
    } else if (command == "audit") {
      audit();
    } else if (command == "snapshot") {
      snapshot();
    } else if (command == "stats") {
      stats();
    } else {
      std::cerr << "Unknown command: " << command << "\n";
    }
    return true;
  }

  void snapshot() {
    wagerledger::settlement::take_snapshot(store_, journal_, snapshots_);
    operations_since_snapshot_ = 0;
    std::cout << "snapshot at sequence " << journal_.last_sequence() << "\n";
  }

 private:
  const wagerledger::config::LedgerConfig& cfg_;
  wagerledger::ledger::LedgerStore& store_;
  wagerledger::wal::Writer& journal_;
  wagerledger::snapshot::Store& snapshots_;
  wagerledger::telemetry::TelemetrySink* telemetry_;
  wagerledger::vault::LocalVault vault_;
  wagerledger::settlement::SettlementEngine engine_;
  wagerledger::settlement::Gateway gateway_;
  std::uint32_t operations_since_snapshot_{0};

  void open_game_vault() {
    if (const auto game_id = engine_.game_identity()) {
      if (vault_.open_account(*game_id, *game_id)) {
        std::cout << "  Game vault: " << wagerledger::common::to_hex(*game_id) << "\n";
      }
    }
  }

  void report(const std::string& command, const wagerledger::settlement::OperationResult& result) {
    if (result.ok()) {
      std::cout << command << ": ok";
      if (command == "attest") {
        std::cout << " fee=" << result.fee << " net=" << result.net;
      }
      std::cout << "\n";
      if (++operations_since_snapshot_ >= cfg_.persistence.snapshot_interval) {
        snapshot();
      }
      return;
    }
    std::cout << command << ": rejected (" << wagerledger::settlement::to_string(result.status)
              << ", code " << result.reject_code << ")";
    if (result.status == wagerledger::settlement::Status::kTransferFailed) {
      std::cout << " vault: " << wagerledger::vault::to_string(result.transfer_status);
    }
    std::cout << "\n";
  }

  static void bad_arguments(const std::string& command) {
    std::cerr << command << ": bad arguments (see --help)\n";
  }

  static std::optional<wagerledger::common::IdempotencyKey> trailing_key(const std::vector<std::string>& args,
                                                                         std::size_t position,
                                                                         bool& ok) {
    ok = true;
    if (args.size() <= position) {
      return std::nullopt;
    }
    auto key = parse_key(args[position]);
    ok = key.has_value() && args.size() == position + 1;
    return key;
  }

  void init(const std::vector<std::string>& args) {
    if (args.size() > 3) {
      return bad_arguments(args[0]);
    }
    const auto seed = args.size() >= 2 ? parse_amount(args[1]) : static_cast<Amount>(cfg_.game.vault_seed);
    const auto authority = parse_identity(args.size() == 3 ? args[2] : cfg_.game.authority);
    if (!seed || *seed > 255 || !authority) {
      return bad_arguments(args[0]);
    }
    wagerledger::settlement::Envelope envelope{
        .request = wagerledger::settlement::Initialize{.seed = static_cast<wagerledger::common::Seed>(*seed),
                                                       .authority = *authority},
    };
    report(args[0], gateway_.submit(*authority, envelope));
    open_game_vault();
  }

  void create(const std::vector<std::string>& args) {
    const auto user = args.size() == 2 ? parse_identity(args[1]) : std::nullopt;
    if (!user) {
      return bad_arguments(args[0]);
    }
    wagerledger::settlement::Envelope envelope{
        .request = wagerledger::settlement::CreateUserAccount{.user = *user},
    };
    report(args[0], gateway_.submit(*user, envelope));
  }

  void open_token(const std::vector<std::string>& args) {
    const auto address = args.size() == 3 ? parse_identity(args[1]) : std::nullopt;
    const auto owner = args.size() == 3 ? parse_identity(args[2]) : std::nullopt;
    if (!address || !owner) {
      return bad_arguments(args[0]);
    }
    std::cout << args[0] << ": " << (vault_.open_account(*address, *owner) ? "ok" : "address taken") << "\n";
  }

  void mint(const std::vector<std::string>& args) {
    const auto address = args.size() == 3 ? parse_identity(args[1]) : std::nullopt;
    const auto amount = args.size() == 3 ? parse_amount(args[2]) : std::nullopt;
    if (!address || !amount) {
      return bad_arguments(args[0]);
    }
    std::cout << args[0] << ": " << (vault_.mint(*address, *amount) ? "ok" : "failed") << "\n";
  }

  void transfer(const std::vector<std::string>& args) {
    if (args.size() < 4) {
      return bad_arguments(args[0]);
    }
    const auto caller = parse_identity(args[1]);
    const auto amount = parse_amount(args[2]);
    const auto token_account = parse_identity(args[3]);
    bool key_ok = true;
    const auto key = trailing_key(args, 4, key_ok);
    if (!caller || !amount || !token_account || !key_ok) {
      return bad_arguments(args[0]);
    }

    wagerledger::settlement::Envelope envelope;
    envelope.idempotency_key = key;
    const auto& command = args[0];
    if (command == "deposit") {
      envelope.request = wagerledger::settlement::Deposit{
          .amount = *amount,
          .user = *caller,
          .source = *token_account,
          .destination = engine_.game_identity().value_or(Identity{}),
      };
    } else if (command == "withdraw") {
      envelope.request = wagerledger::settlement::Withdraw{
          .amount = *amount, .user = *caller, .destination = *token_account};
    } else if (command == "admin-deposit") {
      envelope.request = wagerledger::settlement::AdminDeposit{.amount = *amount, .source = *token_account};
    } else {
      envelope.request = wagerledger::settlement::AdminWithdraw{.amount = *amount, .destination = *token_account};
    }
    report(command, gateway_.submit(*caller, envelope));
  }

  void attest(const std::vector<std::string>& args) {
    if (args.size() < 5) {
      return bad_arguments(args[0]);
    }
    const auto caller = parse_identity(args[1]);
    const auto stake = parse_amount(args[2]);
    const auto winner = args[3] == "-" ? std::nullopt : parse_identity(args[3]);
    const auto loser = args[4] == "-" ? std::nullopt : parse_identity(args[4]);
    bool key_ok = true;
    const auto key = trailing_key(args, 5, key_ok);
    if (!caller || !stake || !key_ok || (args[3] != "-" && !winner) || (args[4] != "-" && !loser)) {
      return bad_arguments(args[0]);
    }

    wagerledger::settlement::Outcome outcome = wagerledger::settlement::NoParticipants{};
    if (winner && loser) {
      outcome = wagerledger::settlement::WinnerAndLoser{.winner = *winner, .loser = *loser};
    } else if (winner) {
      outcome = wagerledger::settlement::WinnerOnly{.winner = *winner};
    } else if (loser) {
      outcome = wagerledger::settlement::LoserOnly{.loser = *loser};
    }

    wagerledger::settlement::Envelope envelope{
        .request = wagerledger::settlement::AttestOutcome{.stake = *stake, .outcome = outcome},
        .idempotency_key = key,
    };
    report(args[0], gateway_.submit(*caller, envelope));
  }

  void balance(const std::vector<std::string>& args) {
    const auto owner = args.size() == 2 ? parse_identity(args[1]) : std::nullopt;
    if (!owner) {
      return bad_arguments(args[0]);
    }
    if (const auto* account = store_.find_account(*owner)) {
      std::cout << "balance " << args[1] << " " << account->balance << "\n";
    } else {
      std::cout << "balance " << args[1] << ": no account\n";
    }
  }

  void history(const std::vector<std::string>& args) {
    const auto owner = args.size() == 2 ? parse_identity(args[1]) : std::nullopt;
    if (!owner) {
      return bad_arguments(args[0]);
    }
    journal_.flush();
    const auto rows = wagerledger::settlement::transfer_history(cfg_.persistence.wal_path, *owner);
    std::cout << "history " << args[1] << ": " << rows.size() << " transfers\n";
    for (const auto& row : rows) {
      std::cout << "  #" << row.sequence << " " << wagerledger::settlement::to_string(row.direction)
                << (row.admin ? " (admin)" : "") << " " << row.amount << " "
                << wagerledger::common::to_hex(row.token_account);
      if (row.idempotency_key) {
        std::cout << " key=" << wagerledger::common::to_hex(*row.idempotency_key);
      }
      std::cout << "\n";
    }
  }

  void audit() {
    const auto game_id = engine_.game_identity();
    const Amount custodied = game_id ? vault_.custodied(*game_id) : 0;
    const auto reconciliation = wagerledger::settlement::reconcile(store_, custodied);
    std::cout << "audit: liabilities=" << reconciliation.liabilities << " custodied=" << reconciliation.custodied;
    if (reconciliation.solvent()) {
      std::cout << " solvent\n";
    } else {
      std::cout << " SHORTFALL=" << reconciliation.shortfall() << "\n";
    }
  }

  void stats() {
    const auto gateway_stats = gateway_.stats();
    std::cout << "stats: accepted=" << gateway_stats.accepted << " rejected=" << gateway_stats.rejected
              << " rejected_auth=" << gateway_stats.rejected_auth << " malformed=" << gateway_stats.malformed
              << "\n";
    if (!telemetry_) {
      return;
    }
    for (const auto& summary : telemetry_->drain_latency()) {
      const auto kind = static_cast<wagerledger::settlement::OperationKind>(summary.id);
      std::cout << "  " << wagerledger::settlement::to_string(kind) << ": count=" << summary.count
                << " mean_ns=" << summary.mean_ns << " p99_ns=" << summary.p99_ns << "\n";
    }
    const auto flows = telemetry_->flows();
    std::cout << "  vault inflow=" << flows.inflow << " outflow=" << flows.outflow << " fees=" << flows.fees
              << "\n";
    const auto samples = telemetry_->drain();
    std::cout << "  drained " << samples.size() << " counter samples, dropped " << telemetry_->dropped()
              << "\n";
  }
};

}  // namespace

int main(int argc, char* argv[]) {
  using namespace wagerledger;

  if (argc > 1 && (std::string_view{argv[1]} == "--help" || std::string_view{argv[1]} == "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  auto config_path = find_config_path(argc, argv);
  config::LedgerConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  WAL path: " << cfg.persistence.wal_path << "\n";
  std::cout << "  Snapshot dir: " << cfg.persistence.snapshot_dir << "\n";

  settlement::EngineConfig engine_cfg{
      .program_id = common::identity_from_hex(cfg.game.program_id).value(),
  };

  try {
    // Opening the journal first cuts off a record torn by a crash.
    wal::Writer journal{cfg.persistence.wal_path, cfg.persistence.wal_flush_threshold};
    if (journal.repaired_bytes() > 0) {
      std::cerr << "Warning: dropped " << journal.repaired_bytes() << " bytes of a torn journal record\n";
    }

    ledger::LedgerStore store;
    const auto summary = settlement::restore(store, engine_cfg, cfg.persistence.snapshot_dir,
                                             cfg.persistence.wal_path);
    std::cout << "  Restored " << store.account_count() << " accounts (snapshot at " << summary.snapshot_sequence
              << ", replayed " << summary.replayed << " journal records)\n";

    snapshot::Store snapshots{cfg.persistence.snapshot_dir};

    std::optional<telemetry::TelemetrySink> telemetry;
    if (cfg.telemetry.enabled) {
      telemetry.emplace(cfg.telemetry.buffer_size);
    }

    CommandShell shell(cfg, engine_cfg, store, journal, snapshots, telemetry ? &*telemetry : nullptr);
    std::cout << "wagerledgerd ready\n";

    for (std::string line; std::getline(std::cin, line);) {
      if (!shell.execute(line)) {
        break;
      }
    }

    shell.snapshot();
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
