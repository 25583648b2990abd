#include "test_api.hpp"

#include <cassert>
#include <string>
#include "vaultcore/api/command_router.hpp"
#include "vaultcore/api/custody_service.hpp"
#include "vaultcore/auth/authenticator.hpp"
#include "vaultcore/executor/guarded_executor.hpp"
#include "vaultcore/ledger/ledger.hpp"
#include "vaultcore/telemetry/notification_sink.hpp"

namespace vaultcore::tests {

namespace {

constexpr common::Principal kOwner = 1;
constexpr common::Principal kAlice = 31;
constexpr common::Principal kBob = 32;

struct Harness {
  explicit Harness(std::optional<common::Principal> owner = kOwner)
      : book({.capacity_limit = 1'000, .withdraw_limit = 100}, owner) {}

  ledger::Ledger book;
  telemetry::NotificationSink sink;
  executor::GuardedExecutor guarded{book, sink};
  auth::Authenticator authenticator;
  api::CustodyService service{book, guarded, authenticator};
};

}  // namespace

void test_custody_history_access() {
  Harness h;
  assert(h.service.deposit(kAlice, 200).ok());
  assert(h.service.receive(kAlice, 50).ok());
  assert(h.service.withdraw(kAlice, 30, [](common::Principal, common::Amount) { return true; }).ok());
  assert(h.service.balance_of(kAlice) == 220);
  assert(h.service.remaining_capacity() == 780);
  assert(h.service.global_stats().total_deposit_operations == 2);

  auto own = h.service.history_of(kAlice, kAlice);
  assert(own.ok());
  assert(own.history.deposits.size() == 2);
  assert(own.history.deposits[1] == 50);
  assert(own.history.withdrawals.size() == 1 && own.history.withdrawals[0] == 30);

  auto snooping = h.service.history_of(kBob, kAlice);
  assert(!snooping.ok());
  assert(snooping.rejection.decision == ledger::Decision::kRejectedNotAuthorized);
  assert(snooping.history.deposits.empty());

  // Owner without a registered key relies on the caller identity alone.
  auto owner_read = h.service.history_of(kOwner, kAlice);
  assert(owner_read.ok());
  assert(owner_read.history.deposits.size() == 2);

  auto empty = h.service.history_of(kBob, kBob);
  assert(empty.ok() && empty.history.deposits.empty());

  Harness ownerless{std::nullopt};
  assert(ownerless.service.deposit(kAlice, 10).ok());
  assert(!ownerless.service.history_of(kOwner, kAlice).ok());
}

void test_custody_history_signed_owner() {
  Harness h;
  auth::PublicKey pub;
  auth::SecretKey sec;
  auth::Authenticator::generate_keypair(pub, sec);
  h.authenticator.register_principal(kOwner, pub);
  assert(h.service.deposit(kAlice, 75).ok());

  assert(!h.service.history_of(kOwner, kAlice).ok());

  const auth::HistoryQuery query{.caller = kOwner, .account = kAlice, .nonce = 1};
  const auto signature = auth::Authenticator::sign_query(sec, query);

  // A signature for another account is not a capability for this one.
  auto wrong_account = h.service.history_of(kOwner, kBob, signature, 1);
  assert(wrong_account.rejection.decision == ledger::Decision::kRejectedNotAuthorized);

  // Nor is one presented with a different nonce.
  assert(!h.service.history_of(kOwner, kAlice, signature, 2).ok());

  // Non-owners cannot borrow the owner's signature.
  assert(!h.service.history_of(kBob, kAlice, signature, 1).ok());

  auto signed_read = h.service.history_of(kOwner, kAlice, signature, 1);
  assert(signed_read.ok());
  assert(signed_read.history.deposits.size() == 1 && signed_read.history.deposits[0] == 75);
}

void test_custody_history_replay_rejected() {
  Harness h;
  auth::PublicKey pub;
  auth::SecretKey sec;
  auth::Authenticator::generate_keypair(pub, sec);
  h.authenticator.register_principal(kOwner, pub);
  assert(h.service.deposit(kAlice, 40).ok());

  const auth::HistoryQuery first_query{.caller = kOwner, .account = kAlice, .nonce = 5};
  const auto first = auth::Authenticator::sign_query(sec, first_query);
  assert(h.service.history_of(kOwner, kAlice, first, 5).ok());

  // The same signed query cannot be presented twice.
  auto replayed = h.service.history_of(kOwner, kAlice, first, 5);
  assert(replayed.rejection.decision == ledger::Decision::kRejectedNotAuthorized);
  assert(replayed.history.deposits.empty());

  // Older nonces stay spent even with a valid signature.
  const auth::HistoryQuery stale_query{.caller = kOwner, .account = kAlice, .nonce = 4};
  const auto stale = auth::Authenticator::sign_query(sec, stale_query);
  assert(!h.service.history_of(kOwner, kAlice, stale, 4).ok());

  // A zero nonce never verifies.
  Harness fresh;
  fresh.authenticator.register_principal(kOwner, pub);
  const auth::HistoryQuery zero_query{.caller = kOwner, .account = kAlice, .nonce = 0};
  assert(!fresh.service.history_of(kOwner, kAlice, auth::Authenticator::sign_query(sec, zero_query), 0).ok());

  const auth::HistoryQuery next_query{.caller = kOwner, .account = kAlice, .nonce = 6};
  const auto next = auth::Authenticator::sign_query(sec, next_query);
  assert(h.service.history_of(kOwner, kAlice, next, 6).ok());

  // Own-history reads need no nonce.
  assert(h.service.history_of(kAlice, kAlice).ok());
}

void test_command_router() {
  Harness h;
  bool deliver = true;
  api::CommandRouter router;
  api::register_custody_commands(router, h.service, [&deliver](common::Principal, common::Amount) { return deliver; });

  assert(router.has_command("deposit"));
  assert(router.has_command("history"));
  assert(router.commands().size() == 7);

  assert(!router.dispatch("").has_value());
  assert(!router.dispatch("   # comment").has_value());

  assert(*router.dispatch("deposit 31 0") ==
         "rejected deposit principal=31 amount=0 balance=0: ZeroAmount code=3001");
  assert(*router.dispatch("deposit 31 600") == "ok deposit principal=31 amount=600 balance=600");
  assert(*router.dispatch("deposit 32 500") ==
         "rejected deposit principal=32 amount=500 balance=0: CapacityExceeded{attempted=500, remaining_capacity=400} code=3002");
  assert(*router.dispatch("withdraw 31 150") ==
         "rejected withdraw principal=31 amount=150 balance=600: WithdrawLimitExceeded{requested=150, limit=100} code=3004");
  assert(*router.dispatch("withdraw 31 100") == "ok withdraw principal=31 amount=100 balance=500");
  assert(*router.dispatch("send 32 400") == "ok deposit principal=32 amount=400 balance=400");

  deliver = false;
  assert(*router.dispatch("withdraw 32 10") ==
         "rejected withdraw principal=32 amount=10 balance=400: TransferFailed{to=32, amount=10} code=3005");

  assert(*router.dispatch("balance 31") == "balance account=31 value=500");
  assert(*router.dispatch("capacity") == "capacity remaining=100");
  assert(*router.dispatch("stats") == "stats deposits=2 withdrawals=1 held=900");
  assert(*router.dispatch("history 31 31") == "history account=31 deposits=[600] withdrawals=[100]");
  assert(*router.dispatch("history 32 31") == "rejected history account=31: NotAuthorized code=3007");

  assert(*router.dispatch("refund 1 2") == "error: unknown command 'refund'");
  assert(*router.dispatch("deposit 31") == "error: usage: deposit <caller> <amount>");
  assert(*router.dispatch("deposit 31 -5") == "error: invalid amount: -5");
  assert(*router.dispatch("history 1 31 zz") ==
         "error: usage: history <caller> <account> [nonce signature_hex]");
  assert(*router.dispatch("history 1 31 3 zz") == "error: invalid signature: zz");
  assert(h.book.check_invariants().empty());
}

}  // namespace vaultcore::tests
