#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <vector>

#include "vaultcore/common/types.hpp"
#include "vaultcore/ledger/decision.hpp"

namespace vaultcore {
namespace telemetry {

struct Notification {
  std::uint64_t sequence{0};
  common::OperationKind kind{common::OperationKind::kDeposit};
  common::Principal principal{0};
  common::Amount amount{0};
  common::Amount balance{0};
};

// Buffers completed-operation notifications until a consumer drains them and
// keeps a running count of every operation outcome. A disabled sink still
// counts outcomes but drops notifications instead of buffering them.
class NotificationSink {
 public:
  explicit NotificationSink(bool enabled = true) : enabled_(enabled) {}

  static constexpr std::size_t kNumOutcomes =
      static_cast<std::size_t>(ledger::Decision::kRejectedArithmeticOverflow) + 1;

  using OutcomeCounters = std::array<std::uint64_t, kNumOutcomes>;

  void publish(Notification notification);
  void record_outcome(ledger::Decision decision);

  [[nodiscard]] std::vector<Notification> drain();
  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] OutcomeCounters counters() const;
  [[nodiscard]] std::uint64_t count(ledger::Decision decision) const;
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

 private:
  const bool enabled_;
  mutable std::mutex mutex_;
  std::vector<Notification> buffer_{};
  std::uint64_t next_sequence_{1};
  OutcomeCounters outcomes_{};
};

}  // namespace telemetry
}  // namespace vaultcore
