#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace fwbuild::process {

enum class CancelReason {
  kNone,
  kUser,
  kTimeout,
  kShutdown,
};

/*
  Cooperative cancellation flag shared between the orchestrator and the
  process driving a build. The first reason recorded wins. An expired
  deadline reads as kTimeout.
*/
class CancelToken {
 public:
  using Clock = std::chrono::steady_clock;

  CancelToken() = default;
  explicit CancelToken(Clock::time_point deadline) : deadline_(deadline) {
  }

  void Cancel(CancelReason reason) {
    std::lock_guard lock(mutex_);
    if (reason_ == CancelReason::kNone) reason_ = reason;
  }

  CancelReason Reason() const {
    std::lock_guard lock(mutex_);
    if (reason_ == CancelReason::kNone && deadline_ && Clock::now() >= *deadline_) {
      reason_ = CancelReason::kTimeout;
    }
    return reason_;
  }

  bool Cancelled() const {
    return Reason() != CancelReason::kNone;
  }

 private:
  mutable std::mutex               mutex_;
  mutable CancelReason             reason_ = CancelReason::kNone;
  std::optional<Clock::time_point> deadline_;
};

// Thrown by work that stopped early because its token was cancelled.
class Cancelled : public std::runtime_error {
 public:
  Cancelled(CancelReason reason, const std::string& what) : std::runtime_error(what), reason_(reason) {
  }

  CancelReason Reason() const {
    return reason_;
  }

 private:
  CancelReason reason_;
};

} // namespace fwbuild::process
