#include "vaultcore/ledger/ledger.hpp"

#include <stdexcept>

#include "vaultcore/common/checked_math.hpp"

namespace vaultcore {
namespace ledger {

namespace {

common::Amount add_or_throw(common::Amount lhs, common::Amount rhs, const char* what) {
  auto sum = common::checked_add(lhs, rhs);
  if (!sum) {
    throw std::logic_error(std::string("ledger overflow: ") + what);
  }
  return *sum;
}

common::Amount sub_or_throw(common::Amount lhs, common::Amount rhs, const char* what) {
  auto diff = common::checked_sub(lhs, rhs);
  if (!diff) {
    throw std::logic_error(std::string("ledger underflow: ") + what);
  }
  return *diff;
}

}  // namespace

Ledger::Ledger(Limits limits, std::optional<common::Principal> owner)
    : limits_(limits), owner_(owner) {
  if (limits_.capacity_limit == 0) {
    throw std::invalid_argument("capacity_limit must be greater than 0");
  }
  if (limits_.withdraw_limit == 0) {
    throw std::invalid_argument("withdraw_limit must be greater than 0");
  }
  if (limits_.withdraw_limit >= limits_.capacity_limit) {
    throw std::invalid_argument("withdraw_limit must be less than capacity_limit");
  }
}

Rejection Ledger::validate_deposit(common::Amount amount) const {
  if (amount == 0) {
    return Rejection::zero_amount();
  }

  const common::Amount remaining = remaining_capacity();
  if (amount > remaining) {
    return Rejection::capacity_exceeded(amount, remaining);
  }

  // Held balance is bounded by the cap, but the lifetime total is not under
  // kHeldBalance.
  if (!common::checked_add(total_deposited_, amount)) {
    return Rejection::arithmetic_overflow(amount);
  }

  return Rejection{};
}

void Ledger::apply_deposit(common::Principal principal, common::Amount amount) {
  auto& account = ensure_account(principal);
  account.balance = add_or_throw(account.balance, amount, "account balance");
  total_deposited_ = add_or_throw(total_deposited_, amount, "total_deposited");
  ++account.deposit_count;
  ++total_deposit_operations_;
  account.deposit_history.push_back(amount);
}

Rejection Ledger::validate_withdraw(common::Principal principal, common::Amount amount) const {
  if (amount == 0) {
    return Rejection::zero_amount();
  }

  if (amount > limits_.withdraw_limit) {
    return Rejection::withdraw_limit_exceeded(amount, limits_.withdraw_limit);
  }

  const common::Amount available = balance_of(principal);
  if (amount > available) {
    return Rejection::insufficient_balance(available, amount);
  }

  if (!common::checked_add(total_withdrawn_, amount)) {
    return Rejection::arithmetic_overflow(amount);
  }

  return Rejection{};
}

void Ledger::apply_withdraw(common::Principal principal, common::Amount amount) {
  auto* account = find_account(principal);
  if (!account) {
    throw std::logic_error("withdraw applied to unknown account");
  }
  account->balance = sub_or_throw(account->balance, amount, "account balance");
  total_withdrawn_ = add_or_throw(total_withdrawn_, amount, "total_withdrawn");
  ++account->withdraw_count;
  ++total_withdraw_operations_;
  account->withdraw_history.push_back(amount);
}

void Ledger::revert_withdraw(common::Principal principal, common::Amount amount) {
  auto* account = find_account(principal);
  if (!account || account->withdraw_history.empty() || account->withdraw_history.back() != amount) {
    throw std::logic_error("revert_withdraw does not match the latest withdrawal");
  }
  account->withdraw_history.pop_back();
  --account->withdraw_count;
  --total_withdraw_operations_;
  total_withdrawn_ = sub_or_throw(total_withdrawn_, amount, "total_withdrawn");
  account->balance = add_or_throw(account->balance, amount, "account balance");
}

common::Amount Ledger::balance_of(common::Principal principal) const {
  if (const auto* account = find_account(principal)) {
    return account->balance;
  }
  return 0;
}

common::Amount Ledger::held_balance() const noexcept {
  return common::checked_sub(total_deposited_, total_withdrawn_).value_or(0);
}

common::Amount Ledger::remaining_capacity() const noexcept {
  return common::checked_sub(limits_.capacity_limit, capped_quantity()).value_or(0);
}

GlobalStats Ledger::global_stats() const noexcept {
  return GlobalStats{
      .total_deposit_operations = total_deposit_operations_,
      .total_withdraw_operations = total_withdraw_operations_,
      .held_balance = held_balance(),
  };
}

Totals Ledger::totals() const noexcept {
  return Totals{.total_deposited = total_deposited_, .total_withdrawn = total_withdrawn_};
}

History Ledger::history_of(common::Principal principal) const {
  History history;
  if (const auto* account = find_account(principal)) {
    history.deposits = account->deposit_history;
    history.withdrawals = account->withdraw_history;
  }
  return history;
}

const AccountState* Ledger::account(common::Principal principal) const {
  return find_account(principal);
}

std::vector<std::string> Ledger::check_invariants() const {
  std::vector<std::string> violations;

  common::Amount sum_balances = 0;
  common::Counter sum_deposit_counts = 0;
  common::Counter sum_withdraw_counts = 0;
  bool overflowed = false;
  for (const auto& [principal, account] : accounts_) {
    if (auto next = common::checked_add(sum_balances, account.balance)) {
      sum_balances = *next;
    } else {
      overflowed = true;
    }
    sum_deposit_counts += account.deposit_count;
    sum_withdraw_counts += account.withdraw_count;

    if (account.deposit_count != account.deposit_history.size() ||
        account.withdraw_count != account.withdraw_history.size()) {
      violations.push_back("account " + std::to_string(principal) + ": counters disagree with history");
    }
  }

  if (overflowed) {
    violations.push_back("sum of balances overflows");
  }

  if (total_withdrawn_ > total_deposited_) {
    violations.push_back("total_withdrawn exceeds total_deposited");
  } else if (total_deposited_ - total_withdrawn_ != sum_balances) {
    violations.push_back("conservation: total_deposited - total_withdrawn (" +
                         std::to_string(total_deposited_ - total_withdrawn_) +
                         ") != sum of balances (" + std::to_string(sum_balances) + ")");
  }

  if (sum_balances > limits_.capacity_limit) {
    violations.push_back("held balance " + std::to_string(sum_balances) + " exceeds capacity " +
                         std::to_string(limits_.capacity_limit));
  }

  if (limits_.policy == CapacityPolicy::kCumulativeDeposits && total_deposited_ > limits_.capacity_limit) {
    violations.push_back("cumulative deposits exceed capacity");
  }

  if (sum_deposit_counts != total_deposit_operations_) {
    violations.push_back("deposit counters disagree with global total");
  }
  if (sum_withdraw_counts != total_withdraw_operations_) {
    violations.push_back("withdraw counters disagree with global total");
  }

  return violations;
}

AccountState& Ledger::ensure_account(common::Principal principal) {
  return accounts_.try_emplace(principal).first->second;
}

AccountState* Ledger::find_account(common::Principal principal) {
  auto it = accounts_.find(principal);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

const AccountState* Ledger::find_account(common::Principal principal) const {
  auto it = accounts_.find(principal);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

common::Amount Ledger::capped_quantity() const noexcept {
  switch (limits_.policy) {
    case CapacityPolicy::kCumulativeDeposits:
      return total_deposited_;
    case CapacityPolicy::kHeldBalance:
      break;
  }
  return held_balance();
}

}  // namespace ledger
}  // namespace vaultcore
