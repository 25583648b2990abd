#include "vaultcore/ledger/decision.hpp"

#include <sstream>

namespace vaultcore {
namespace ledger {

Rejection Rejection::zero_amount() {
  return Rejection{.decision = Decision::kRejectedZeroAmount, .reject_code = kRejectCodeZeroAmount};
}

Rejection Rejection::capacity_exceeded(common::Amount attempted, common::Amount remaining) {
  return Rejection{.decision = Decision::kRejectedCapacityExceeded,
                   .reject_code = kRejectCodeCapacityExceeded,
                   .requested = attempted,
                   .remaining_capacity = remaining};
}

Rejection Rejection::insufficient_balance(common::Amount available, common::Amount requested) {
  return Rejection{.decision = Decision::kRejectedInsufficientBalance,
                   .reject_code = kRejectCodeInsufficientBalance,
                   .requested = requested,
                   .available = available};
}

Rejection Rejection::withdraw_limit_exceeded(common::Amount requested, common::Amount limit) {
  return Rejection{.decision = Decision::kRejectedWithdrawLimitExceeded,
                   .reject_code = kRejectCodeWithdrawLimitExceeded,
                   .requested = requested,
                   .limit = limit};
}

Rejection Rejection::transfer_failed(common::Principal to, common::Amount amount) {
  return Rejection{.decision = Decision::kRejectedTransferFailed,
                   .reject_code = kRejectCodeTransferFailed,
                   .principal = to,
                   .requested = amount};
}

Rejection Rejection::reentrancy() {
  return Rejection{.decision = Decision::kRejectedReentrancy, .reject_code = kRejectCodeReentrancy};
}

Rejection Rejection::not_authorized() {
  return Rejection{.decision = Decision::kRejectedNotAuthorized, .reject_code = kRejectCodeNotAuthorized};
}

Rejection Rejection::arithmetic_overflow(common::Amount requested) {
  return Rejection{.decision = Decision::kRejectedArithmeticOverflow,
                   .reject_code = kRejectCodeArithmeticOverflow,
                   .requested = requested};
}

std::string_view to_string(Decision decision) noexcept {
  switch (decision) {
    case Decision::kAccepted:
      return "Accepted";
    case Decision::kRejectedZeroAmount:
      return "ZeroAmount";
    case Decision::kRejectedCapacityExceeded:
      return "CapacityExceeded";
    case Decision::kRejectedInsufficientBalance:
      return "InsufficientBalance";
    case Decision::kRejectedWithdrawLimitExceeded:
      return "WithdrawLimitExceeded";
    case Decision::kRejectedTransferFailed:
      return "TransferFailed";
    case Decision::kRejectedReentrancy:
      return "ReentrancyRejected";
    case Decision::kRejectedNotAuthorized:
      return "NotAuthorized";
    case Decision::kRejectedArithmeticOverflow:
      return "ArithmeticOverflow";
  }
  return "Unknown";
}

std::string describe(const Rejection& rejection) {
  std::ostringstream oss;
  oss << to_string(rejection.decision);
  switch (rejection.decision) {
    case Decision::kRejectedCapacityExceeded:
      oss << "{attempted=" << rejection.requested << ", remaining_capacity=" << rejection.remaining_capacity << "}";
      break;
    case Decision::kRejectedInsufficientBalance:
      oss << "{available=" << rejection.available << ", requested=" << rejection.requested << "}";
      break;
    case Decision::kRejectedWithdrawLimitExceeded:
      oss << "{requested=" << rejection.requested << ", limit=" << rejection.limit << "}";
      break;
    case Decision::kRejectedTransferFailed:
      oss << "{to=" << rejection.principal << ", amount=" << rejection.requested << "}";
      break;
    case Decision::kRejectedArithmeticOverflow:
      oss << "{requested=" << rejection.requested << "}";
      break;
    default:
      break;
  }
  if (rejection.reject_code != 0) {
    oss << " code=" << rejection.reject_code;
  }
  return oss.str();
}

}  // namespace ledger
}  // namespace vaultcore
