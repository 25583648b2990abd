#include "vaultcore/api/custody_service.hpp"

namespace vaultcore {
namespace api {

executor::OperationResult CustodyService::deposit(common::Principal caller, common::Amount amount_received) {
  return executor_.deposit(caller, amount_received);
}

executor::OperationResult CustodyService::receive(common::Principal caller, common::Amount amount_received) {
  return executor_.receive(caller, amount_received);
}

executor::OperationResult CustodyService::withdraw(common::Principal caller,
                                                   common::Amount amount,
                                                   const executor::TransferFn& transfer) {
  return executor_.withdraw(caller, amount, transfer);
}

common::Amount CustodyService::balance_of(common::Principal account) const {
  return ledger_.balance_of(account);
}

common::Amount CustodyService::remaining_capacity() const {
  return ledger_.remaining_capacity();
}

ledger::GlobalStats CustodyService::global_stats() const {
  return ledger_.global_stats();
}

HistoryResult CustodyService::history_of(common::Principal caller,
                                         common::Principal account,
                                         const std::optional<auth::Signature>& signature,
                                         std::uint64_t nonce) {
  HistoryResult result;
  if (caller != account && !is_privileged(caller, account, signature, nonce)) {
    result.rejection = ledger::Rejection::not_authorized();
    return result;
  }
  result.history = ledger_.history_of(account);
  return result;
}

bool CustodyService::is_privileged(common::Principal caller,
                                   common::Principal account,
                                   const std::optional<auth::Signature>& signature,
                                   std::uint64_t nonce) {
  const auto owner = ledger_.owner();
  if (!owner || *owner != caller) {
    return false;
  }
  if (!authenticator_.has_principal(caller)) {
    return true;
  }
  if (!signature) {
    return false;
  }

  // Nonces start at 1 and must strictly increase per signer.
  auto it = last_query_nonce_.find(caller);
  const std::uint64_t last = it == last_query_nonce_.end() ? 0 : it->second;
  if (nonce <= last) {
    return false;
  }
  const auth::HistoryQuery query{.caller = caller, .account = account, .nonce = nonce};
  if (!authenticator_.verify_query(query, *signature)) {
    return false;
  }
  last_query_nonce_[caller] = nonce;
  return true;
}

}  // namespace api
}  // namespace vaultcore
