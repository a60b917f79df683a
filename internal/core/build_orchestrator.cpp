#include "internal/core/build_orchestrator.hpp"

#include <algorithm>

#include "internal/artifacts/artifact_store.hpp"
#include "internal/artifacts/progress_tracker.hpp"
#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/build_runner.hpp"
#include "internal/model/build_request.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/build_worker.hpp"
#include "internal/scheduler/job_queue.hpp"
#include "internal/status/status_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/workspace/workspace_pool.hpp"

namespace fwbuild::core {

using namespace fwbuild::v1;
using fwbuild::observability::IntField;
using fwbuild::observability::StringField;

namespace {

// Enough of the log to find the latest step marker.
constexpr std::size_t kProgressTailLines = 64;

[[noreturn]] void Reject(ErrorKind kind, const std::string& message) {
  FWBUILD_LOG_WARN("build rejected", {StringField("kind", model::ErrorKindName(kind)), StringField("reason", message)});
  throw util::AdmissionError(kind, message);
}

} // namespace

BuildOrchestrator::BuildOrchestrator(OrchestratorOptions options, std::shared_ptr<status::StatusStore> store,
                                     std::shared_ptr<workspace::WorkspacePool> workspaces,
                                     std::shared_ptr<catalog::MetadataCatalog> catalog,
                                     std::shared_ptr<artifacts::ArtifactStore> artifacts, std::shared_ptr<BuildRunner> runner)
    : options_(options),
      store_(std::move(store)),
      workspaces_(std::move(workspaces)),
      catalog_(std::move(catalog)),
      artifacts_(std::move(artifacts)),
      runner_(std::move(runner)),
      queue_(std::make_shared<scheduler::JobQueue>()) {
  if (options_.max_in_flight == 0) throw std::invalid_argument("max_in_flight must be positive");
  if (options_.build_timeout.count() <= 0) throw std::invalid_argument("build_timeout must be positive");
}

BuildOrchestrator::~BuildOrchestrator() {
  Stop();
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void BuildOrchestrator::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (started_) return;

  store_->Hydrate();

  std::vector<std::string> interrupted;
  for (const auto& build : store_->ListByState(BUILD_STATE_RUNNING)) {
    interrupted.push_back(build.id());
  }
  auto pending = store_->Reconcile([this](Build& build) {
    try {
      build.set_log_ref(artifacts_->LogRef(build.id()));
    } catch (const std::invalid_argument& e) {
      FWBUILD_LOG_WARN("cannot derive log ref", {StringField("build_id", build.id()), StringField("error", e.what())});
    }
  });
  for (const auto& id : interrupted) {
    try {
      artifacts_->Seal(id);
    } catch (const std::exception& e) {
      FWBUILD_LOG_WARN("cannot seal interrupted build", {StringField("build_id", id), StringField("error", e.what())});
    }
  }

  workspaces_->Initialize();

  for (const auto& build : pending) {
    queue_->Enqueue(build.id());
  }

  const auto workers = workspaces_->Capacity();
  for (uint32_t i = 0; i < workers; ++i) {
    auto worker = std::make_unique<scheduler::BuildWorker>(static_cast<int>(i), queue_, this);
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  started_ = true;

  FWBUILD_LOG_INFO("orchestrator started",
                   {IntField("workers", workers), IntField("requeued", static_cast<int64_t>(pending.size())),
                    IntField("interrupted", static_cast<int64_t>(interrupted.size()))});
}

void BuildOrchestrator::CancelRunning(process::CancelReason reason) {
  std::lock_guard lock(cancel_mutex_);
  for (auto& [_, token] : tokens_) {
    token->Cancel(reason);
  }
}

void BuildOrchestrator::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  if (stopping_.exchange(true)) return;

  queue_->Shutdown();
  workspaces_->Shutdown();
  CancelRunning(process::CancelReason::kShutdown);

  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();

  if (started_) FWBUILD_LOG_INFO("orchestrator stopped");
}

void BuildOrchestrator::ReportFatal(const std::string& reason) {
  {
    std::lock_guard lock(failure_mutex_);
    if (failed_) return;
    failure_reason_ = reason;
    failed_         = true;
  }
  failure_cv_.notify_all();

  FWBUILD_LOG_ERROR("status store failed; orchestrator halting", {StringField("error", reason)});

  queue_->Shutdown();
  workspaces_->Shutdown();
  CancelRunning(process::CancelReason::kShutdown);
}

bool BuildOrchestrator::Failed() const {
  return failed_;
}

std::string BuildOrchestrator::FailureReason() const {
  std::lock_guard lock(failure_mutex_);
  return failure_reason_;
}

bool BuildOrchestrator::WaitForFailure(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(failure_mutex_);
  return failure_cv_.wait_for(lock, timeout, [this] { return failed_.load(); });
}

// ------------------------------------------------------------------
// Admission
// ------------------------------------------------------------------

std::string BuildOrchestrator::Submit(const BuildRequest& raw) {
  if (failed_) throw util::StoreUnavailable(FailureReason());
  if (stopping_) throw util::ShuttingDown("orchestrator is stopping");

  auto request = model::Normalize(raw);
  if (request.vehicle().empty() || request.board().empty() || request.version_id().empty()) {
    Reject(ERROR_KIND_INVALID_REQUEST, "vehicle, board and version are required");
  }

  std::optional<CatalogVersion> version;
  try {
    version = catalog_->Lookup(request.vehicle(), request.version_id(), request.board());
  } catch (const util::CatalogUnavailable& e) {
    Reject(ERROR_KIND_CATALOG_UNAVAILABLE, e.what());
  }
  if (!version) {
    Reject(ERROR_KIND_INVALID_REQUEST, "unknown combination " + request.vehicle() + "/" + request.board() + "/" +
                                           request.version_id());
  }
  for (const auto& feature : request.features()) {
    const auto& known = version->features();
    bool        found = std::any_of(known.begin(), known.end(), [&](const FeatureOption& f) { return f.define() == feature; });
    if (!found) Reject(ERROR_KIND_INVALID_REQUEST, "unknown feature " + feature + " at version " + request.version_id());
  }

  const auto hash = model::RequestHash(request);

  std::lock_guard lock(admission_mutex_);

  if (options_.deduplicate) {
    if (auto existing = store_->FindActiveByHash(hash)) {
      FWBUILD_LOG_INFO("build deduplicated", {StringField("build_id", *existing)});
      return *existing;
    }
  }

  if (store_->CountActive() >= options_.max_in_flight) {
    Reject(ERROR_KIND_QUEUE_FULL, "in-flight ceiling of " + std::to_string(options_.max_in_flight) + " reached");
  }

  Build build;
  build.set_id(util::ToString(util::GenerateUUID()));
  build.set_sequence(store_->NextSequence());
  *build.mutable_request() = request;
  build.set_request_hash(hash);
  build.set_state(BUILD_STATE_PENDING);
  *build.mutable_created_at() = util::NowProto();

  try {
    store_->Insert(build);
  } catch (const util::StoreUnavailable& e) {
    ReportFatal(e.what());
    throw;
  }
  queue_->Enqueue(build.id());

  FWBUILD_LOG_INFO("build admitted",
                   {StringField("build_id", build.id()), StringField("vehicle", request.vehicle()),
                    StringField("board", request.board()), StringField("version", request.version_id()),
                    IntField("features", request.features_size())});
  return build.id();
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

Build BuildOrchestrator::Get(const std::string& id) const {
  auto build = store_->Get(id);
  if (!build) throw util::NotFound("build " + id + " not found");

  if (build->state() == BUILD_STATE_RUNNING) {
    try {
      build->set_progress_percent(artifacts::ProgressPercent(artifacts_->GetLog(id, kProgressTailLines)));
    } catch (const util::NotFound&) {
      build->set_progress_percent(0);
    }
  }
  return *build;
}

std::vector<Build> BuildOrchestrator::List(const BuildFilter& filter) const {
  return store_->List(filter);
}

std::string BuildOrchestrator::GetLog(const std::string& id, std::size_t tail_lines) const {
  if (!store_->Get(id)) throw util::NotFound("build " + id + " not found");
  return artifacts_->GetLog(id, tail_lines);
}

std::string BuildOrchestrator::GetArtifact(const std::string& id) const {
  auto build = store_->Get(id);
  if (!build) throw util::NotFound("build " + id + " not found");
  if (build->artifact_ref().empty()) throw util::NotFound("build " + id + " has no artifact");
  return artifacts_->GetArtifact(id);
}

std::optional<Build> BuildOrchestrator::WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const {
  return store_->WaitForTerminal(id, timeout);
}

void BuildOrchestrator::Prune(const std::string& id) {
  try {
    store_->Prune(id);
  } catch (const util::StoreUnavailable& e) {
    ReportFatal(e.what());
    throw;
  }
  artifacts_->Remove(id);
  FWBUILD_LOG_INFO("build pruned", {StringField("build_id", id)});
}

// ------------------------------------------------------------------
// Cancellation
// ------------------------------------------------------------------

CancelResult BuildOrchestrator::Cancel(const std::string& id) {
  std::unique_lock lock(cancel_mutex_);

  auto build = store_->Get(id);
  if (!build) throw util::NotFound("build " + id + " not found");
  if (model::IsTerminal(build->state())) return CancelResult::kAlreadyTerminal;

  if (auto it = tokens_.find(id); it != tokens_.end()) {
    it->second->Cancel(process::CancelReason::kUser);
    FWBUILD_LOG_INFO("cancel requested", {StringField("build_id", id)});
    return CancelResult::kOk;
  }

  // Not running: the PENDING -> RUNNING hand-off also takes cancel_mutex_.
  std::optional<Build> cancelled;
  try {
    cancelled = store_->Transition(id, BUILD_STATE_PENDING, BUILD_STATE_CANCELLED);
  } catch (const util::StoreUnavailable& e) {
    // ReportFatal takes cancel_mutex_ to stop running builds
    lock.unlock();
    ReportFatal(e.what());
    throw;
  }

  // finishing right now; the terminal write wins
  if (!cancelled) return CancelResult::kAlreadyTerminal;

  // only after the CANCELLED write is durable; a worker that dequeues it
  // first skips it as no longer PENDING
  queue_->Remove(id);
  FWBUILD_LOG_INFO("pending build cancelled", {StringField("build_id", id)});
  return CancelResult::kOk;
}

// ------------------------------------------------------------------
// Execution
// ------------------------------------------------------------------

void BuildOrchestrator::Execute(const std::string& build_id) {
  auto queued = store_->Get(build_id);
  if (!queued || queued->state() != BUILD_STATE_PENDING) return;

  auto lease = workspaces_->Acquire(build_id);
  auto token = std::make_shared<process::CancelToken>(process::CancelToken::Clock::now() + options_.build_timeout);

  std::optional<Build> running;
  {
    std::lock_guard lock(cancel_mutex_);
    if (stopping_ || failed_) return;
    running = store_->Transition(build_id, BUILD_STATE_PENDING, BUILD_STATE_RUNNING,
                                 [&](Build& b) { b.set_workspace_id(lease.SlotId()); });
    // cancelled between dequeue and lease
    if (!running) return;
    tokens_[build_id] = token;
  }

  JobOutcome outcome;
  try {
    auto log = artifacts_->OpenLogWriter(build_id);
    log->WriteLine("==> build " + build_id + " on slot " + std::to_string(lease.SlotId()));
    outcome = runner_->Run(*running, lease, *log, *token);
  } catch (const std::exception& e) {
    outcome.state         = BUILD_STATE_FAILURE;
    outcome.error_kind    = ERROR_KIND_INTERNAL;
    outcome.error_message = std::string("build log unavailable: ") + e.what();
  }

  Finalize(build_id, outcome);
  // lease released here, after the terminal state is durable
}

void BuildOrchestrator::Finalize(const std::string& build_id, JobOutcome outcome) {
  {
    std::lock_guard lock(cancel_mutex_);
    auto            it = tokens_.find(build_id);
    // a cancel accepted after the job's last step still ends the build CANCELLED
    if (it != tokens_.end() && it->second->Reason() == process::CancelReason::kUser &&
        outcome.state != BUILD_STATE_CANCELLED) {
      FWBUILD_LOG_INFO("cancel arrived after the job finished", {StringField("build_id", build_id)});
      outcome = BuildRunner::CancelledOutcome(process::CancelReason::kUser);
    }
    tokens_.erase(build_id);
  }

  try {
    artifacts_->Seal(build_id);
  } catch (const std::exception& e) {
    FWBUILD_LOG_WARN("cannot seal build output", {StringField("build_id", build_id), StringField("error", e.what())});
  }

  const bool has_log = artifacts_->HasLog(build_id);

  auto finished = store_->Transition(build_id, BUILD_STATE_RUNNING, outcome.state, [&](Build& b) {
    if (outcome.state == BUILD_STATE_FAILURE) {
      b.mutable_error()->set_kind(outcome.error_kind);
      b.mutable_error()->set_message(outcome.error_message);
    }
    b.set_artifact_ref(outcome.artifact_ref);
    if (has_log) b.set_log_ref(artifacts_->LogRef(build_id));
  });

  if (!finished) {
    FWBUILD_LOG_ERROR("build left RUNNING unexpectedly", {StringField("build_id", build_id)});
  }
}

} // namespace fwbuild::core
