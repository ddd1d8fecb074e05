#pragma once

namespace strongbox::common {

/// Instance-wide non-reentrant flag. Only `reentrancy_guard` touches it.
class reentrancy_lock final {
 public:
  bool held() const { return held_; }

 private:
  friend class reentrancy_guard;

  bool held_{false};
  bool reentry_attempted_{false};
};

/// Scoped acquisition of a `reentrancy_lock`.
///
/// Acquisition never blocks: when the lock is already held the guard reports
/// `acquired() == false` and marks the holder as having seen a re-entry
/// attempt. The lock is released on every exit path of the acquiring scope.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(reentrancy_lock& lock) : lock_{lock} {
    if (lock_.held_) {
      lock_.reentry_attempted_ = true;
      return;
    }
    lock_.held_ = true;
    lock_.reentry_attempted_ = false;
    acquired_ = true;
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;
  reentrancy_guard(reentrancy_guard&&) = delete;
  reentrancy_guard& operator=(reentrancy_guard&&) = delete;

  ~reentrancy_guard() {
    if (acquired_) {
      lock_.held_ = false;
    }
  }

  bool acquired() const { return acquired_; }

  /// Whether a nested acquisition was refused while this guard held the lock.
  bool reentry_attempted() const {
    return acquired_ && lock_.reentry_attempted_;
  }

 private:
  reentrancy_lock& lock_;
  bool acquired_{false};
};

}  // namespace strongbox::common
