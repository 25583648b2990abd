#pragma once

#include <cstdint>
#include <string_view>

namespace vaultcore {
namespace common {

using Principal = std::uint64_t;
using Amount = std::uint64_t;
using Counter = std::uint64_t;

enum class OperationKind : std::uint8_t {
  kDeposit,
  kWithdraw,
};

inline constexpr std::string_view to_string(OperationKind kind) noexcept {
  switch (kind) {
    case OperationKind::kDeposit:
      return "deposit";
    case OperationKind::kWithdraw:
      return "withdraw";
  }
  return "unknown";
}

}  // namespace common
}  // namespace vaultcore
