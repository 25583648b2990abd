#pragma once

#include <limits>
#include <optional>

#include "vaultcore/common/types.hpp"

namespace vaultcore {
namespace common {

// Unsigned arithmetic that reports wrap instead of performing it.

[[nodiscard]] inline constexpr std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept {
  if (rhs > std::numeric_limits<Amount>::max() - lhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

[[nodiscard]] inline constexpr std::optional<Amount> checked_sub(Amount lhs, Amount rhs) noexcept {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

}  // namespace common
}  // namespace vaultcore
