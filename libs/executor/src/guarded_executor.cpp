#include "vaultcore/executor/guarded_executor.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace vaultcore {
namespace executor {

OperationResult GuardedExecutor::deposit(common::Principal principal, common::Amount amount) {
  return execute_deposit(principal, amount);
}

OperationResult GuardedExecutor::receive(common::Principal principal, common::Amount amount) {
  return execute_deposit(principal, amount);
}

OperationResult GuardedExecutor::execute_deposit(common::Principal principal, common::Amount amount) {
  OperationResult result{.kind = common::OperationKind::kDeposit, .principal = principal, .amount = amount};

  {
    GuardLock lock(guard_);
    if (!lock.owns_lock()) {
      result.rejection = ledger::Rejection::reentrancy();
    } else {
      result.rejection = ledger_.validate_deposit(amount);
      if (result.rejection.accepted()) {
        ledger_.apply_deposit(principal, amount);
      }
    }
    result.balance = ledger_.balance_of(principal);
  }

  return finish(std::move(result));
}

OperationResult GuardedExecutor::withdraw(common::Principal principal,
                                          common::Amount amount,
                                          const TransferFn& transfer) {
  OperationResult result{.kind = common::OperationKind::kWithdraw, .principal = principal, .amount = amount};

  {
    GuardLock lock(guard_);
    if (!lock.owns_lock()) {
      result.rejection = ledger::Rejection::reentrancy();
      result.balance = ledger_.balance_of(principal);
      return finish(std::move(result));
    }
    if (!transfer) {
      throw std::invalid_argument("withdraw requires a transfer callback");
    }

    result.rejection = ledger_.validate_withdraw(principal, amount);
    if (!result.rejection.accepted()) {
      result.balance = ledger_.balance_of(principal);
      lock.release();
      return finish(std::move(result));
    }

    // Debit before the transfer: a callback that re-enters sees the reduced
    // balance and is rejected by the guard anyway.
    ledger_.apply_withdraw(principal, amount);

    bool delivered = false;
    try {
      delivered = transfer(principal, amount);
    } catch (const std::exception& ex) {
      result.detail = ex.what();
    } catch (...) {
      ledger_.revert_withdraw(principal, amount);
      throw;
    }

    if (!delivered) {
      ledger_.revert_withdraw(principal, amount);
      result.rejection = ledger::Rejection::transfer_failed(principal, amount);
    }
    result.balance = ledger_.balance_of(principal);
  }

  return finish(std::move(result));
}

OperationResult GuardedExecutor::finish(OperationResult result) {
  sink_.record_outcome(result.rejection.decision);
  if (result.ok()) {
    sink_.publish(telemetry::Notification{
        .kind = result.kind,
        .principal = result.principal,
        .amount = result.amount,
        .balance = result.balance,
    });
  }
  return result;
}

}  // namespace executor
}  // namespace vaultcore
