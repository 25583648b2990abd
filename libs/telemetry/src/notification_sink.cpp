#include "vaultcore/telemetry/notification_sink.hpp"

#include <utility>

namespace vaultcore {
namespace telemetry {

void NotificationSink::publish(Notification notification) {
  if (!enabled_) {
    return;
  }
  std::scoped_lock lock(mutex_);
  notification.sequence = next_sequence_++;
  buffer_.push_back(notification);
}

void NotificationSink::record_outcome(ledger::Decision decision) {
  std::scoped_lock lock(mutex_);
  ++outcomes_[static_cast<std::size_t>(decision)];
}

std::vector<Notification> NotificationSink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::size_t NotificationSink::pending() const {
  std::scoped_lock lock(mutex_);
  return buffer_.size();
}

NotificationSink::OutcomeCounters NotificationSink::counters() const {
  std::scoped_lock lock(mutex_);
  return outcomes_;
}

std::uint64_t NotificationSink::count(ledger::Decision decision) const {
  std::scoped_lock lock(mutex_);
  return outcomes_[static_cast<std::size_t>(decision)];
}

}  // namespace telemetry
}  // namespace vaultcore
