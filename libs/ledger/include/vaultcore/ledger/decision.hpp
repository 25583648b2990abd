#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "vaultcore/common/types.hpp"

namespace vaultcore {
namespace ledger {

enum class Decision : std::uint8_t {
  kAccepted,
  kRejectedZeroAmount,
  kRejectedCapacityExceeded,
  kRejectedInsufficientBalance,
  kRejectedWithdrawLimitExceeded,
  kRejectedTransferFailed,
  kRejectedReentrancy,
  kRejectedNotAuthorized,
  kRejectedArithmeticOverflow,
};

inline constexpr std::uint16_t kRejectCodeZeroAmount = 3001;
inline constexpr std::uint16_t kRejectCodeCapacityExceeded = 3002;
inline constexpr std::uint16_t kRejectCodeInsufficientBalance = 3003;
inline constexpr std::uint16_t kRejectCodeWithdrawLimitExceeded = 3004;
inline constexpr std::uint16_t kRejectCodeTransferFailed = 3005;
inline constexpr std::uint16_t kRejectCodeReentrancy = 3006;
inline constexpr std::uint16_t kRejectCodeNotAuthorized = 3007;
inline constexpr std::uint16_t kRejectCodeArithmeticOverflow = 3008;

// Outcome of an admissibility check. Only the fields relevant to `decision`
// are populated:
//   kRejectedCapacityExceeded      requested, remaining_capacity
//   kRejectedInsufficientBalance   available, requested
//   kRejectedWithdrawLimitExceeded requested, limit
//   kRejectedTransferFailed        principal (recipient), requested
struct Rejection {
  Decision decision{Decision::kAccepted};
  std::uint16_t reject_code{0};
  common::Principal principal{0};
  common::Amount requested{0};
  common::Amount remaining_capacity{0};
  common::Amount available{0};
  common::Amount limit{0};

  [[nodiscard]] bool accepted() const noexcept { return decision == Decision::kAccepted; }

  static Rejection zero_amount();
  static Rejection capacity_exceeded(common::Amount attempted, common::Amount remaining);
  static Rejection insufficient_balance(common::Amount available, common::Amount requested);
  static Rejection withdraw_limit_exceeded(common::Amount requested, common::Amount limit);
  static Rejection transfer_failed(common::Principal to, common::Amount amount);
  static Rejection reentrancy();
  static Rejection not_authorized();
  static Rejection arithmetic_overflow(common::Amount requested);
};

[[nodiscard]] std::string_view to_string(Decision decision) noexcept;
[[nodiscard]] std::string describe(const Rejection& rejection);

}  // namespace ledger
}  // namespace vaultcore
