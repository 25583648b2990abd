#pragma once

#include <functional>
#include <string>

#include "vaultcore/common/types.hpp"
#include "vaultcore/executor/reentrancy_guard.hpp"
#include "vaultcore/ledger/decision.hpp"
#include "vaultcore/ledger/ledger.hpp"
#include "vaultcore/telemetry/notification_sink.hpp"

namespace vaultcore {
namespace executor {

// Outbound delivery of `amount` to `to`. Returns false if the value was not
// delivered. May re-enter the executor that invoked it.
using TransferFn = std::function<bool(common::Principal to, common::Amount amount)>;

struct OperationResult {
  common::OperationKind kind{common::OperationKind::kDeposit};
  ledger::Rejection rejection{};
  common::Principal principal{0};
  common::Amount amount{0};
  common::Amount balance{0};  // principal's balance after the call
  std::string detail{};

  [[nodiscard]] bool ok() const noexcept { return rejection.accepted(); }
};

// Runs every state-mutating ledger operation under one reentrancy guard, in
// checks-effects-interactions order. A withdrawal whose transfer fails is
// rolled back before the call returns, so every rejection leaves the ledger
// exactly as it was.
class GuardedExecutor {
 public:
  explicit GuardedExecutor(ledger::Ledger& ledger, telemetry::NotificationSink& sink)
      : ledger_(ledger), sink_(sink) {}

  GuardedExecutor(const GuardedExecutor&) = delete;
  GuardedExecutor& operator=(const GuardedExecutor&) = delete;

  OperationResult deposit(common::Principal principal, common::Amount amount);

  // Value that arrived without an explicit operation; handled as a deposit.
  OperationResult receive(common::Principal principal, common::Amount amount);

  OperationResult withdraw(common::Principal principal, common::Amount amount, const TransferFn& transfer);

  [[nodiscard]] ReentrancyGuard::State guard_state() const noexcept { return guard_.state(); }

 private:
  ledger::Ledger& ledger_;
  telemetry::NotificationSink& sink_;
  ReentrancyGuard guard_{};

  OperationResult execute_deposit(common::Principal principal, common::Amount amount);
  OperationResult finish(OperationResult result);
};

}  // namespace executor
}  // namespace vaultcore
