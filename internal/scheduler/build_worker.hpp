#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "job_queue.hpp"

namespace fwbuild::core {
class BuildOrchestrator;
}

namespace fwbuild::scheduler {

/*
  One worker per workspace slot.

  Loop: pull the next build id, hand it to the orchestrator, repeat.
  The orchestrator leases the workspace and records the outcome.
*/
class BuildWorker {
 public:
  BuildWorker(int index, std::shared_ptr<JobQueue> queue, fwbuild::core::BuildOrchestrator* orchestrator);
  ~BuildWorker();

  void Start();
  // Caller shuts the queue down first; Stop() only joins.
  void Stop();

 private:
  void Run();

  int                               index_;
  std::shared_ptr<JobQueue>         queue_;
  fwbuild::core::BuildOrchestrator* orchestrator_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace fwbuild::scheduler
