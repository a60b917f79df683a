#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fwbuild/v1.hpp"
#include "internal/process/cancel_token.hpp"

namespace fwbuild::artifacts {
class ArtifactStore;
}
namespace fwbuild::catalog {
class MetadataCatalog;
}
namespace fwbuild::scheduler {
class BuildWorker;
class JobQueue;
} // namespace fwbuild::scheduler
namespace fwbuild::status {
class StatusStore;
}
namespace fwbuild::workspace {
class WorkspacePool;
}

namespace fwbuild::core {

class BuildRunner;
struct JobOutcome;

struct OrchestratorOptions {
  // Ceiling on PENDING + RUNNING builds.
  uint32_t                  max_in_flight = 0;
  std::chrono::milliseconds build_timeout{0};
  bool                      deduplicate = false;
};

enum class CancelResult {
  kOk,
  kAlreadyTerminal,
};

/*
  Admits build requests, queues them FIFO and drives them through the
  worker pool (one worker per workspace slot).

  Submit/Get/List/Cancel never block on workspaces or the toolchain and
  are safe to call from any thread.
*/
class BuildOrchestrator {
 public:
  BuildOrchestrator(OrchestratorOptions options, std::shared_ptr<status::StatusStore> store,
                    std::shared_ptr<workspace::WorkspacePool> workspaces, std::shared_ptr<catalog::MetadataCatalog> catalog,
                    std::shared_ptr<artifacts::ArtifactStore> artifacts, std::shared_ptr<BuildRunner> runner);
  ~BuildOrchestrator();

  BuildOrchestrator(const BuildOrchestrator&)            = delete;
  BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

  // Hydrates the store, reconciles interrupted builds, re-enqueues PENDING
  // builds in admission order and starts the workers.
  void Start();

  // Running builds are cancelled as interrupted; queued builds stay
  // PENDING for the next start. Idempotent.
  void Stop();

  /*
    Throws util::AdmissionError{QUEUE_FULL | INVALID_REQUEST |
    CATALOG_UNAVAILABLE}; no build exists afterwards. Throws
    util::StoreUnavailable once the store has failed.
  */
  std::string Submit(const fwbuild::v1::BuildRequest& request);

  // Throws util::NotFound.
  fwbuild::v1::Build Get(const std::string& id) const;

  std::vector<fwbuild::v1::Build> List(const fwbuild::v1::BuildFilter& filter) const;

  /*
    kOk means the build ends CANCELLED: a PENDING build is cancelled at once,
    a RUNNING one when its worker finishes, even if the job had already
    completed its last step. kAlreadyTerminal once the worker has begun
    recording the outcome. Throws util::NotFound; throws
    util::StoreUnavailable (and halts the orchestrator) when the write fails.
  */
  CancelResult Cancel(const std::string& id);

  // Partial while RUNNING. Throws util::NotFound.
  std::string GetLog(const std::string& id, std::size_t tail_lines = 0) const;

  // Primary artifact of a SUCCESS build. Throws util::NotFound.
  std::string GetArtifact(const std::string& id) const;

  std::optional<fwbuild::v1::Build> WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const;

  // Drops a terminal build with its log and artifacts. A store write
  // failure halts the orchestrator.
  void Prune(const std::string& id);

  // Worker entry point: lease, run and record one queued build.
  void Execute(const std::string& build_id);

  // A status store write failed. Admission stops and workers wind down.
  void ReportFatal(const std::string& reason);

  bool        Failed() const;
  std::string FailureReason() const;

  // True once failed; false on timeout.
  bool WaitForFailure(std::chrono::milliseconds timeout) const;

 private:
  void Finalize(const std::string& build_id, JobOutcome outcome);
  void CancelRunning(process::CancelReason reason);

  OrchestratorOptions                       options_;
  std::shared_ptr<status::StatusStore>      store_;
  std::shared_ptr<workspace::WorkspacePool> workspaces_;
  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  std::shared_ptr<artifacts::ArtifactStore> artifacts_;
  std::shared_ptr<BuildRunner>              runner_;

  std::shared_ptr<scheduler::JobQueue>                   queue_;
  std::vector<std::unique_ptr<scheduler::BuildWorker>> workers_;

  // Serializes the ceiling check with the insert.
  std::mutex admission_mutex_;

  // Serializes Cancel with the PENDING -> RUNNING hand-off and guards tokens_.
  std::mutex                                                              cancel_mutex_;
  std::unordered_map<std::string, std::shared_ptr<process::CancelToken>> tokens_;

  std::mutex        lifecycle_mutex_;
  bool              started_ = false;
  std::atomic<bool> stopping_{false};

  mutable std::mutex              failure_mutex_;
  mutable std::condition_variable failure_cv_;
  std::string                     failure_reason_;
  std::atomic<bool>               failed_{false};
};

} // namespace fwbuild::core
