#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "vaultcore/common/types.hpp"
#include "vaultcore/ledger/decision.hpp"

namespace vaultcore {
namespace ledger {

// Which quantity the capacity ceiling bounds. The two are never combined.
enum class CapacityPolicy : std::uint8_t {
  kHeldBalance,         // total_deposited - total_withdrawn
  kCumulativeDeposits,  // total_deposited, never decreases
};

struct Limits {
  common::Amount capacity_limit{0};
  common::Amount withdraw_limit{0};
  CapacityPolicy policy{CapacityPolicy::kHeldBalance};
};

struct AccountState {
  common::Amount balance{0};
  common::Counter deposit_count{0};
  common::Counter withdraw_count{0};
  std::vector<common::Amount> deposit_history{};
  std::vector<common::Amount> withdraw_history{};
};

struct GlobalStats {
  common::Counter total_deposit_operations{0};
  common::Counter total_withdraw_operations{0};
  common::Amount held_balance{0};
};

struct Totals {
  common::Amount total_deposited{0};
  common::Amount total_withdrawn{0};
};

struct History {
  std::vector<common::Amount> deposits{};
  std::vector<common::Amount> withdrawals{};
};

// Pure state-transition core. Every apply_* assumes the matching validate_*
// accepted against the current state; callers sequence the two without any
// other mutation in between.
class Ledger {
 public:
  explicit Ledger(Limits limits, std::optional<common::Principal> owner = std::nullopt);

  [[nodiscard]] Rejection validate_deposit(common::Amount amount) const;
  void apply_deposit(common::Principal principal, common::Amount amount);

  [[nodiscard]] Rejection validate_withdraw(common::Principal principal, common::Amount amount) const;
  void apply_withdraw(common::Principal principal, common::Amount amount);

  // Undoes the latest apply_withdraw for `principal`. Throws std::logic_error
  // if that withdrawal is not the most recent one recorded.
  void revert_withdraw(common::Principal principal, common::Amount amount);

  [[nodiscard]] common::Amount balance_of(common::Principal principal) const;
  [[nodiscard]] common::Amount held_balance() const noexcept;
  [[nodiscard]] common::Amount remaining_capacity() const noexcept;
  [[nodiscard]] GlobalStats global_stats() const noexcept;
  [[nodiscard]] Totals totals() const noexcept;
  [[nodiscard]] History history_of(common::Principal principal) const;
  [[nodiscard]] const AccountState* account(common::Principal principal) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }

  [[nodiscard]] const Limits& limits() const noexcept { return limits_; }
  [[nodiscard]] std::optional<common::Principal> owner() const noexcept { return owner_; }

  // Recomputes aggregate state from the accounts. Returns one message per
  // violated invariant; empty when the ledger is consistent.
  [[nodiscard]] std::vector<std::string> check_invariants() const;

 private:
  Limits limits_;
  std::optional<common::Principal> owner_;
  std::unordered_map<common::Principal, AccountState> accounts_{};

  common::Amount total_deposited_{0};
  common::Amount total_withdrawn_{0};
  common::Counter total_deposit_operations_{0};
  common::Counter total_withdraw_operations_{0};

  AccountState& ensure_account(common::Principal principal);
  AccountState* find_account(common::Principal principal);
  const AccountState* find_account(common::Principal principal) const;

  [[nodiscard]] common::Amount capped_quantity() const noexcept;
};

}  // namespace ledger
}  // namespace vaultcore
