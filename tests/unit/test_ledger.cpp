#include "test_ledger.hpp"

#include <cassert>
#include <limits>
#include <random>
#include <stdexcept>

#include "vaultcore/ledger/ledger.hpp"

namespace vaultcore::tests {

namespace {

constexpr common::Principal kAlice = 11;
constexpr common::Principal kBob = 12;

ledger::Ledger make_ledger(ledger::CapacityPolicy policy = ledger::CapacityPolicy::kHeldBalance) {
  return ledger::Ledger{{.capacity_limit = 1'000, .withdraw_limit = 100, .policy = policy}, kAlice};
}

bool deposit(ledger::Ledger& ledger, common::Principal who, common::Amount amount) {
  if (!ledger.validate_deposit(amount).accepted()) {
    return false;
  }
  ledger.apply_deposit(who, amount);
  return true;
}

bool withdraw(ledger::Ledger& ledger, common::Principal who, common::Amount amount) {
  if (!ledger.validate_withdraw(who, amount).accepted()) {
    return false;
  }
  ledger.apply_withdraw(who, amount);
  return true;
}

}  // namespace

void test_ledger_example_scenarios() {
  auto ledger = make_ledger();

  auto zero = ledger.validate_deposit(0);
  assert(zero.decision == ledger::Decision::kRejectedZeroAmount);
  assert(zero.reject_code == ledger::kRejectCodeZeroAmount);

  assert(deposit(ledger, kAlice, 600));
  assert(ledger.balance_of(kAlice) == 600);
  assert(ledger.totals().total_deposited == 600);

  auto over = ledger.validate_deposit(500);
  assert(over.decision == ledger::Decision::kRejectedCapacityExceeded);
  assert(over.requested == 500);
  assert(over.remaining_capacity == 400);

  auto too_large = ledger.validate_withdraw(kAlice, 150);
  assert(too_large.decision == ledger::Decision::kRejectedWithdrawLimitExceeded);
  assert(too_large.requested == 150);
  assert(too_large.limit == 100);

  assert(withdraw(ledger, kAlice, 100));
  assert(ledger.balance_of(kAlice) == 500);
  assert(ledger.totals().total_withdrawn == 100);

  assert(deposit(ledger, kBob, 400));
  assert(ledger.held_balance() == 900);
  assert(ledger.remaining_capacity() == 100);

  const auto stats = ledger.global_stats();
  assert(stats.total_deposit_operations == 2);
  assert(stats.total_withdraw_operations == 1);
  assert(stats.held_balance == 900);

  const auto history = ledger.history_of(kAlice);
  assert(history.deposits.size() == 1 && history.deposits[0] == 600);
  assert(history.withdrawals.size() == 1 && history.withdrawals[0] == 100);
  assert(ledger.check_invariants().empty());
}

void test_ledger_rejections_leave_state_unchanged() {
  auto ledger = make_ledger();
  assert(deposit(ledger, kAlice, 1'000));
  assert(ledger.remaining_capacity() == 0);

  const auto before = ledger.global_stats();
  assert(!deposit(ledger, kBob, 1));
  assert(!withdraw(ledger, kBob, 1));
  assert(!withdraw(ledger, kAlice, 0));
  const auto after = ledger.global_stats();

  assert(before.total_deposit_operations == after.total_deposit_operations);
  assert(before.total_withdraw_operations == after.total_withdraw_operations);
  assert(before.held_balance == after.held_balance);
  assert(ledger.account(kBob) == nullptr);
  assert(ledger.account_count() == 1);
}

void test_ledger_withdraw_checks() {
  auto ledger = make_ledger();
  assert(deposit(ledger, kAlice, 50));

  // Limit is checked before balance.
  auto over_limit = ledger.validate_withdraw(kAlice, 101);
  assert(over_limit.decision == ledger::Decision::kRejectedWithdrawLimitExceeded);

  auto short_funds = ledger.validate_withdraw(kAlice, 60);
  assert(short_funds.decision == ledger::Decision::kRejectedInsufficientBalance);
  assert(short_funds.available == 50);
  assert(short_funds.requested == 60);

  auto unknown = ledger.validate_withdraw(kBob, 1);
  assert(unknown.decision == ledger::Decision::kRejectedInsufficientBalance);
  assert(unknown.available == 0);

  assert(withdraw(ledger, kAlice, 50));
  assert(ledger.balance_of(kAlice) == 0);
  assert(ledger.account(kAlice) != nullptr);
  assert(ledger.account(kAlice)->withdraw_count == 1);
  assert(!withdraw(ledger, kAlice, 1));
}

void test_ledger_cumulative_capacity_policy() {
  auto held = make_ledger(ledger::CapacityPolicy::kHeldBalance);
  auto cumulative = make_ledger(ledger::CapacityPolicy::kCumulativeDeposits);

  for (auto* ledger : {&held, &cumulative}) {
    assert(deposit(*ledger, kAlice, 1'000));
    assert(withdraw(*ledger, kAlice, 100));
  }

  assert(held.remaining_capacity() == 100);
  assert(deposit(held, kBob, 100));

  assert(cumulative.remaining_capacity() == 0);
  auto rejected = cumulative.validate_deposit(100);
  assert(rejected.decision == ledger::Decision::kRejectedCapacityExceeded);
  assert(rejected.remaining_capacity == 0);

  assert(held.check_invariants().empty());
  assert(cumulative.check_invariants().empty());
}

void test_ledger_rejects_invalid_limits() {
  auto throws = [](common::Amount capacity, common::Amount withdraw) {
    try {
      ledger::Ledger ledger{{.capacity_limit = capacity, .withdraw_limit = withdraw}};
    } catch (const std::invalid_argument&) {
      return true;
    }
    return false;
  };

  assert(throws(0, 1));
  assert(throws(10, 0));
  assert(throws(10, 10));
  assert(throws(10, 11));
  assert(!throws(10, 9));
}

void test_ledger_lifetime_overflow_fails_closed() {
  constexpr auto kMax = std::numeric_limits<common::Amount>::max();
  ledger::Ledger ledger{{.capacity_limit = kMax, .withdraw_limit = kMax - 1}};

  assert(deposit(ledger, kAlice, kMax - 1));
  assert(withdraw(ledger, kAlice, kMax - 1));
  assert(ledger.held_balance() == 0);

  auto overflow = ledger.validate_deposit(2);
  assert(overflow.decision == ledger::Decision::kRejectedArithmeticOverflow);
  assert(overflow.reject_code == ledger::kRejectCodeArithmeticOverflow);
  assert(deposit(ledger, kAlice, 1));
  assert(ledger.totals().total_deposited == kMax);
  assert(ledger.check_invariants().empty());
}

void test_ledger_revert_withdraw() {
  auto ledger = make_ledger();
  assert(deposit(ledger, kAlice, 300));
  assert(withdraw(ledger, kAlice, 40));
  assert(withdraw(ledger, kAlice, 70));

  ledger.revert_withdraw(kAlice, 70);
  assert(ledger.balance_of(kAlice) == 260);
  assert(ledger.totals().total_withdrawn == 40);
  assert(ledger.global_stats().total_withdraw_operations == 1);
  assert(ledger.history_of(kAlice).withdrawals.size() == 1);
  assert(ledger.check_invariants().empty());

  bool threw = false;
  try {
    ledger.revert_withdraw(kAlice, 99);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void test_ledger_conservation_under_random_sequence() {
  auto ledger = make_ledger();
  std::mt19937_64 rng{20240611};
  std::uniform_int_distribution<common::Principal> who{1, 6};
  std::uniform_int_distribution<common::Amount> amount{0, 250};

  common::Counter deposits = 0;
  common::Counter withdrawals = 0;
  for (int i = 0; i < 2'000; ++i) {
    const auto principal = who(rng);
    const auto value = amount(rng);
    if (rng() % 2 == 0) {
      deposits += deposit(ledger, principal, value) ? 1 : 0;
    } else {
      const auto before = ledger.balance_of(principal);
      const bool ok = withdraw(ledger, principal, value);
      assert(ok == (value != 0 && value <= 100 && value <= before));
      withdrawals += ok ? 1 : 0;
    }

    assert(ledger.held_balance() <= ledger.limits().capacity_limit);
    assert(ledger.check_invariants().empty());
  }

  const auto stats = ledger.global_stats();
  assert(stats.total_deposit_operations == deposits);
  assert(stats.total_withdraw_operations == withdrawals);
}

}  // namespace vaultcore::tests
