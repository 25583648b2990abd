#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>

#include "vaultcore/auth/authenticator.hpp"
#include "vaultcore/common/types.hpp"
#include "vaultcore/executor/guarded_executor.hpp"
#include "vaultcore/ledger/decision.hpp"
#include "vaultcore/ledger/ledger.hpp"

namespace vaultcore {
namespace api {

struct HistoryResult {
  ledger::Rejection rejection{};
  ledger::History history{};

  [[nodiscard]] bool ok() const noexcept { return rejection.accepted(); }
};

// Operations exposed to the invoking environment. `caller` is the principal
// the environment has already attributed the call (and any value) to.
class CustodyService {
 public:
  CustodyService(ledger::Ledger& ledger, executor::GuardedExecutor& executor, const auth::Authenticator& authenticator)
      : ledger_(ledger), executor_(executor), authenticator_(authenticator) {}

  // `amount_received` is already in custody when this is called.
  executor::OperationResult deposit(common::Principal caller, common::Amount amount_received);
  executor::OperationResult receive(common::Principal caller, common::Amount amount_received);
  executor::OperationResult withdraw(common::Principal caller, common::Amount amount, const executor::TransferFn& transfer);

  [[nodiscard]] common::Amount balance_of(common::Principal account) const;
  [[nodiscard]] common::Amount remaining_capacity() const;
  [[nodiscard]] ledger::GlobalStats global_stats() const;

  // A principal may always read its own history. Reads of another account
  // are reserved to the ledger owner; when the owner has a registered key the
  // read must also carry the owner's signature over the query, with a nonce
  // greater than any the owner has used before.
  [[nodiscard]] HistoryResult history_of(common::Principal caller,
                                         common::Principal account,
                                         const std::optional<auth::Signature>& signature = std::nullopt,
                                         std::uint64_t nonce = 0);

 private:
  ledger::Ledger& ledger_;
  executor::GuardedExecutor& executor_;
  const auth::Authenticator& authenticator_;
  std::unordered_map<common::Principal, std::uint64_t> last_query_nonce_{};

  [[nodiscard]] bool is_privileged(common::Principal caller,
                                   common::Principal account,
                                   const std::optional<auth::Signature>& signature,
                                   std::uint64_t nonce);
};

}  // namespace api
}  // namespace vaultcore
