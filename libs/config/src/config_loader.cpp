#include "vaultcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace vaultcore {
namespace config {

namespace {

// Missing keys keep their defaults. A key that is present with the wrong type
// is reported instead of silently replaced by the default.
std::int64_t get_int_or(const toml::table& tbl,
                        std::string_view section,
                        std::string_view key,
                        std::int64_t default_val,
                        std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return default_val;
  }
  if (auto val = node.value_exact<std::int64_t>()) {
    return *val;
  }
  errors.push_back({std::string(section) + "." + std::string(key), "must be an integer"});
  return default_val;
}

std::string get_str_or(const toml::table& tbl,
                       std::string_view section,
                       std::string_view key,
                       std::string_view default_val,
                       std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return std::string(default_val);
  }
  if (auto val = node.value_exact<std::string_view>()) {
    return std::string(*val);
  }
  errors.push_back({std::string(section) + "." + std::string(key), "must be a string"});
  return std::string(default_val);
}

LedgerConfig parse_ledger(const toml::table& root, std::vector<ValidationError>& errors) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.capacity_limit = get_int_or(*ledger, "ledger", "capacity_limit", cfg.capacity_limit, errors);
    cfg.withdraw_limit = get_int_or(*ledger, "ledger", "withdraw_limit", cfg.withdraw_limit, errors);
    cfg.capacity_policy = get_str_or(*ledger, "ledger", "capacity_policy", cfg.capacity_policy, errors);
  }
  return cfg;
}

OwnerConfig parse_owner(const toml::table& root, std::vector<ValidationError>& errors) {
  OwnerConfig cfg;
  if (auto* owner = root["owner"].as_table()) {
    const auto principal = (*owner)["principal"];
    if (auto val = principal.value_exact<std::int64_t>()) {
      cfg.principal = *val;
    } else if (principal) {
      errors.push_back({"owner.principal", "must be an integer"});
    }
    cfg.public_key = get_str_or(*owner, "owner", "public_key", cfg.public_key, errors);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root, std::vector<ValidationError>& errors) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    const auto node = (*telemetry)["enabled"];
    if (auto val = node.value_exact<bool>()) {
      cfg.enabled = *val;
    } else if (node) {
      errors.push_back({"telemetry.enabled", "must be a boolean"});
    }
  }
  return cfg;
}

VaultConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  VaultConfig cfg;
  cfg.ledger = parse_ledger(root, errors);
  cfg.owner = parse_owner(root, errors);
  cfg.telemetry = parse_telemetry(root, errors);
  return cfg;
}

bool is_hex_key(std::string_view value) {
  return value.size() == 64 && std::all_of(value.begin(), value.end(), [](unsigned char c) {
           return std::isxdigit(c) != 0;
         });
}

}  // namespace

std::optional<ledger::CapacityPolicy> parse_capacity_policy(std::string_view name) {
  if (name == "held_balance") {
    return ledger::CapacityPolicy::kHeldBalance;
  }
  if (name == "cumulative_deposits") {
    return ledger::CapacityPolicy::kCumulativeDeposits;
  }
  return std::nullopt;
}

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  std::vector<ValidationError> type_errors;
  result.config = parse_config(parse_result.table(), type_errors);
  result.errors = validate(result.config);
  result.errors.insert(result.errors.begin(), type_errors.begin(), type_errors.end());
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  std::vector<ValidationError> type_errors;
  result.config = parse_config(parse_result.table(), type_errors);
  result.errors = validate(result.config);
  result.errors.insert(result.errors.begin(), type_errors.begin(), type_errors.end());
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const VaultConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ledger.capacity_limit <= 0) {
    errors.push_back({"ledger.capacity_limit", "must be greater than 0"});
  }

  if (config.ledger.withdraw_limit <= 0) {
    errors.push_back({"ledger.withdraw_limit", "must be greater than 0"});
  }

  if (config.ledger.withdraw_limit >= config.ledger.capacity_limit) {
    errors.push_back({"ledger.withdraw_limit", "must be less than capacity_limit"});
  }

  if (!parse_capacity_policy(config.ledger.capacity_policy)) {
    errors.push_back({"ledger.capacity_policy", "must be \"held_balance\" or \"cumulative_deposits\""});
  }

  if (config.owner.principal && *config.owner.principal < 0) {
    errors.push_back({"owner.principal", "must not be negative"});
  }

  if (!config.owner.public_key.empty()) {
    if (!is_hex_key(config.owner.public_key)) {
      errors.push_back({"owner.public_key", "must be 64 hex characters"});
    }
    if (!config.owner.principal) {
      errors.push_back({"owner.public_key", "requires owner.principal"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# VaultCore Configuration
# Generated default configuration

[ledger]
capacity_limit = 1000
withdraw_limit = 100
capacity_policy = "held_balance"  # or "cumulative_deposits"

[owner]
principal = 1

[telemetry]
enabled = true
)";
}

ledger::Limits ConfigLoader::limits(const VaultConfig& config) {
  return ledger::Limits{
      .capacity_limit = static_cast<common::Amount>(config.ledger.capacity_limit),
      .withdraw_limit = static_cast<common::Amount>(config.ledger.withdraw_limit),
      .policy = parse_capacity_policy(config.ledger.capacity_policy).value_or(ledger::CapacityPolicy::kHeldBalance),
  };
}

std::optional<common::Principal> ConfigLoader::owner(const VaultConfig& config) {
  if (!config.owner.principal || *config.owner.principal < 0) {
    return std::nullopt;
  }
  return static_cast<common::Principal>(*config.owner.principal);
}

}  // namespace config
}  // namespace vaultcore
