#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/workspace/source_control.hpp"

namespace fwbuild::testing {

/*
  Source control double. A checkout is a directory holding a ".fake-vcs"
  marker and a CHECKED_OUT file naming the ref. Checkout wipes everything
  else, the way a hard clean would.

  StallCheckouts(true) makes Checkout hang, like a fetch from an unresponsive
  mirror, until the token is cancelled or the stall is lifted.
*/
class FakeSourceControl final : public workspace::SourceControl {
 public:
  void Clone(const std::filesystem::path& dir, const process::OutputSink& log, const process::CancelToken*) override {
    clones_++;
    if (fail_clone_) {
      throw util::CheckoutError(fwbuild::v1::ERROR_KIND_GIT_FAILURE, "clone refused");
    }
    std::filesystem::create_directories(dir);
    std::ofstream(dir / ".fake-vcs") << "ok";
    if (log) log("cloned\n");
  }

  std::string Checkout(const std::filesystem::path& dir, const std::string& ref, const process::OutputSink& log,
                       const process::CancelToken* token) override {
    checkouts_++;
    while (stall_checkouts_) {
      if (token && token->Cancelled()) {
        throw process::Cancelled(token->Reason(), "checkout of " + ref + " cancelled");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (!IsHealthy(dir)) {
      throw util::CheckoutError(fwbuild::v1::ERROR_KIND_CORRUPT_WORKSPACE, dir.string() + " is not a checkout");
    }
    {
      std::lock_guard lock(mutex_);
      if (unresolvable_.count(ref) > 0) {
        throw util::CheckoutError(fwbuild::v1::ERROR_KIND_UNRESOLVABLE_REF, "cannot resolve " + ref);
      }
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      if (entry.path().filename() == ".fake-vcs") continue;
      std::filesystem::remove_all(entry.path());
    }
    std::ofstream(dir / "CHECKED_OUT") << ref;
    if (log) log("checked out " + ref + "\n");
    return "commit-" + ref;
  }

  bool IsHealthy(const std::filesystem::path& dir) override {
    return std::filesystem::exists(dir / ".fake-vcs");
  }

  void MarkUnresolvable(const std::string& ref) {
    std::lock_guard lock(mutex_);
    unresolvable_.insert(ref);
  }

  void FailClones(bool fail) {
    fail_clone_ = fail;
  }

  void StallCheckouts(bool stall) {
    stall_checkouts_ = stall;
  }

  int Clones() const {
    return clones_;
  }

  int Checkouts() const {
    return checkouts_;
  }

 private:
  std::atomic<int>      clones_{0};
  std::atomic<int>      checkouts_{0};
  std::atomic<bool>     fail_clone_{false};
  std::atomic<bool>     stall_checkouts_{false};
  std::mutex            mutex_;
  std::set<std::string> unresolvable_;
};

} // namespace fwbuild::testing
