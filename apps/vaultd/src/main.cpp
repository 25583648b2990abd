#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <stdexcept>
#include <string>

#include "vaultcore/api/command_router.hpp"
#include "vaultcore/api/custody_service.hpp"
#include "vaultcore/auth/authenticator.hpp"
#include "vaultcore/config/config_loader.hpp"
#include "vaultcore/executor/guarded_executor.hpp"
#include "vaultcore/ledger/ledger.hpp"
#include "vaultcore/telemetry/notification_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [script_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./vaultd.toml or generates defaults\n"
            << "  script_file: Commands to execute, one per line (default: stdin)\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./vaultd.toml",
      "/etc/vaultcore/vaultd.toml",
      home ? std::filesystem::path{home} / ".config/vaultcore/vaultd.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

void print_notifications(vaultcore::telemetry::NotificationSink& sink) {
  for (const auto& note : sink.drain()) {
    std::cout << "  event #" << note.sequence << " " << vaultcore::common::to_string(note.kind)
              << " principal=" << note.principal << " amount=" << note.amount
              << " balance=" << note.balance << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace vaultcore;

  if (argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::VaultConfig cfg;

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

  const auto limits = config::ConfigLoader::limits(cfg);
  const auto owner = config::ConfigLoader::owner(cfg);

  std::cout << "Config loaded successfully\n";
  std::cout << "  Capacity limit: " << limits.capacity_limit << "\n";
  std::cout << "  Withdraw limit: " << limits.withdraw_limit << "\n";
  std::cout << "  Capacity policy: " << cfg.ledger.capacity_policy << "\n";

  auth::Authenticator authenticator;
  if (owner && !cfg.owner.public_key.empty()) {
    const auto key = auth::Authenticator::parse_public_key(cfg.owner.public_key);
    if (!key) {
      std::cerr << "Invalid owner public key\n";
      return 1;
    }
    authenticator.register_principal(*owner, *key);
  }
  std::cout << "  Owner: " << (owner ? std::to_string(*owner) : std::string{"none"})
            << " (" << authenticator.principal_count() << " registered keys)\n";

  ledger::Ledger ledger{limits, owner};
  telemetry::NotificationSink notifications{cfg.telemetry.enabled};
  executor::GuardedExecutor executor{ledger, notifications};
  api::CustodyService service{ledger, executor, authenticator};

  executor::TransferFn transfer = [](common::Principal to, common::Amount amount) {
    std::cout << "  transfer " << amount << " -> " << to << "\n";
    return true;
  };

  api::CommandRouter router;
  api::register_custody_commands(router, service, transfer);

  std::ifstream script_file;
  if (argc > 2) {
    script_file.open(argv[2]);
    if (!script_file) {
      std::cerr << "Failed to open script: " << argv[2] << "\n";
      return 1;
    }
  }
  std::istream& input = argc > 2 ? static_cast<std::istream&>(script_file) : std::cin;

  std::cout << "vaultd ready\n";

  std::string line;
  while (std::getline(input, line)) {
    try {
      if (auto output = router.dispatch(line)) {
        std::cout << *output << "\n";
      }
    } catch (const std::logic_error& ex) {
      std::cerr << "Fatal ledger error: " << ex.what() << "\n";
      return 2;
    }
    print_notifications(notifications);
  }

  const auto stats = ledger.global_stats();
  const auto totals = ledger.totals();
  std::cout << "Deposits: " << stats.total_deposit_operations
            << ", withdrawals: " << stats.total_withdraw_operations
            << ", held: " << stats.held_balance
            << " (deposited " << totals.total_deposited << ", withdrawn " << totals.total_withdrawn << ")\n";

  const auto violations = ledger.check_invariants();
  for (const auto& violation : violations) {
    std::cerr << "Invariant violated: " << violation << "\n";
  }
  return violations.empty() ? 0 : 2;
}
