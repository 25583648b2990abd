#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vaultcore/common/types.hpp"
#include "vaultcore/ledger/ledger.hpp"

namespace vaultcore {
namespace config {

struct LedgerConfig {
  std::int64_t capacity_limit{1000};
  std::int64_t withdraw_limit{100};
  std::string capacity_policy{"held_balance"};
};

struct OwnerConfig {
  std::optional<std::int64_t> principal{};
  std::string public_key{};  // hex-encoded ed25519 key, optional
};

struct TelemetryConfig {
  bool enabled{true};
};

struct VaultConfig {
  LedgerConfig ledger;
  OwnerConfig owner;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  VaultConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const VaultConfig& config);
  static std::string generate_default();

  // Only meaningful for a config that passed validate().
  static ledger::Limits limits(const VaultConfig& config);
  static std::optional<common::Principal> owner(const VaultConfig& config);
};

std::optional<ledger::CapacityPolicy> parse_capacity_policy(std::string_view name);

}  // namespace config
}  // namespace vaultcore
