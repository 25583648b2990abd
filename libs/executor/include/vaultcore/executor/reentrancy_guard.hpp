#pragma once

#include <atomic>
#include <cstdint>

namespace vaultcore {
namespace executor {

class ReentrancyGuard {
 public:
  enum class State : std::uint8_t {
    kIdle,
    kInProgress,
  };

  // Atomic test-and-set: returns false if an operation is already in flight.
  [[nodiscard]] bool try_enter() noexcept {
    return !in_progress_.exchange(true, std::memory_order_acq_rel);
  }

  void leave() noexcept { in_progress_.store(false, std::memory_order_release); }

  [[nodiscard]] State state() const noexcept {
    return in_progress_.load(std::memory_order_acquire) ? State::kInProgress : State::kIdle;
  }

 private:
  std::atomic<bool> in_progress_{false};
};

// Scoped acquisition of a ReentrancyGuard. A lock that failed to acquire never
// releases the guard it lost to.
class GuardLock {
 public:
  explicit GuardLock(ReentrancyGuard& guard) noexcept
      : guard_(guard), owns_(guard.try_enter()) {}

  GuardLock(const GuardLock&) = delete;
  GuardLock& operator=(const GuardLock&) = delete;
  GuardLock(GuardLock&&) = delete;
  GuardLock& operator=(GuardLock&&) = delete;

  ~GuardLock() { release(); }

  [[nodiscard]] bool owns_lock() const noexcept { return owns_; }

  void release() noexcept {
    if (owns_) {
      guard_.leave();
      owns_ = false;
    }
  }

 private:
  ReentrancyGuard& guard_;
  bool owns_;
};

}  // namespace executor
}  // namespace vaultcore
