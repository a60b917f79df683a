#include "build_worker.hpp"

#include "internal/core/build_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fwbuild::scheduler {

BuildWorker::BuildWorker(int index, std::shared_ptr<JobQueue> queue, fwbuild::core::BuildOrchestrator* orchestrator)
    : index_(index), queue_(std::move(queue)), orchestrator_(orchestrator) {
}

BuildWorker::~BuildWorker() {
  Stop();
}

void BuildWorker::Start() {
  running_ = true;
  thread_  = std::thread(&BuildWorker::Run, this);
}

void BuildWorker::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void BuildWorker::Run() {
  while (running_) {
    auto build_id = queue_->Dequeue();
    if (!build_id) break;

    try {
      orchestrator_->Execute(*build_id);
    } catch (const util::StoreUnavailable& e) {
      FWBUILD_LOG_ERROR("status store write failed",
                        {observability::IntField("worker", index_), observability::StringField("build_id", *build_id),
                         observability::StringField("error", e.what())});
      orchestrator_->ReportFatal(e.what());
      break;
    } catch (const util::ShuttingDown&) {
      break;
    } catch (const std::exception& e) {
      // Execute records job failures itself; reaching here is a bug in the
      // bookkeeping around the job, not in the job.
      FWBUILD_LOG_ERROR("worker iteration failed",
                        {observability::IntField("worker", index_), observability::StringField("build_id", *build_id),
                         observability::StringField("error", e.what())});
      orchestrator_->ReportFatal(e.what());
      break;
    }
  }
}

} // namespace fwbuild::scheduler
