#include "internal/core/build_runner.hpp"

#include "internal/artifacts/artifact_store.hpp"
#include "internal/catalog/metadata_catalog.hpp"
#include "internal/configurator/build_configurator.hpp"
#include "internal/model/build_request.hpp"
#include "internal/observability/logging.hpp"
#include "internal/toolchain/toolchain_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/workspace/workspace_pool.hpp"

namespace fwbuild::core {

using namespace fwbuild::v1;
using fwbuild::observability::IntField;
using fwbuild::observability::StringField;

namespace {

JobOutcome Failure(ErrorKind kind, std::string message) {
  JobOutcome outcome;
  outcome.state         = BUILD_STATE_FAILURE;
  outcome.error_kind    = kind;
  outcome.error_message = std::move(message);
  return outcome;
}

// The log is best effort once the job has already failed.
void NoteInLog(artifacts::LogWriter& log, const std::string& build_id, const std::string& line) {
  try {
    log.WriteLine(line);
  } catch (const std::exception& e) {
    FWBUILD_LOG_WARN("build log write failed", {StringField("build_id", build_id), StringField("error", e.what())});
  }
}

} // namespace

BuildRunner::BuildRunner(std::shared_ptr<workspace::WorkspacePool> workspaces, std::shared_ptr<catalog::MetadataCatalog> catalog,
                         std::shared_ptr<configurator::BuildConfigurator> configurator,
                         std::shared_ptr<toolchain::ToolchainRunner> toolchain, std::shared_ptr<artifacts::ArtifactStore> artifacts)
    : workspaces_(std::move(workspaces)),
      catalog_(std::move(catalog)),
      configurator_(std::move(configurator)),
      toolchain_(std::move(toolchain)),
      artifacts_(std::move(artifacts)) {
}

JobOutcome BuildRunner::CancelledOutcome(process::CancelReason reason) {
  switch (reason) {
    case process::CancelReason::kTimeout:
      return Failure(ERROR_KIND_TIMEOUT, "build exceeded its maximum duration");
    case process::CancelReason::kShutdown:
      return Failure(ERROR_KIND_INTERRUPTED, "orchestrator stopped while the build was running");
    default: {
      JobOutcome outcome;
      outcome.state = BUILD_STATE_CANCELLED;
      return outcome;
    }
  }
}

JobOutcome BuildRunner::Run(const Build& build, workspace::WorkspaceLease& lease, artifacts::LogWriter& log,
                            const process::CancelToken& token) const {
  JobOutcome outcome;
  try {
    outcome = RunUnchecked(build, lease, log, token);
  } catch (const process::Cancelled& e) {
    outcome = CancelledOutcome(e.Reason());
  } catch (const util::KindedError& e) {
    outcome = Failure(e.Kind(), e.what());
  } catch (const util::CatalogUnavailable& e) {
    outcome = Failure(ERROR_KIND_CATALOG_UNAVAILABLE, e.what());
  } catch (const std::exception& e) {
    outcome = Failure(ERROR_KIND_INTERNAL, e.what());
  }

  if (outcome.state == BUILD_STATE_FAILURE) {
    NoteInLog(log, build.id(), "==> FAILED (" + model::ErrorKindName(outcome.error_kind) + "): " + outcome.error_message);
    FWBUILD_LOG_WARN("build failed", {StringField("build_id", build.id()), IntField("slot", lease.SlotId()),
                                      StringField("kind", model::ErrorKindName(outcome.error_kind)),
                                      StringField("error", outcome.error_message)});
  } else if (outcome.state == BUILD_STATE_CANCELLED) {
    NoteInLog(log, build.id(), "==> CANCELLED");
  }
  return outcome;
}

JobOutcome BuildRunner::RunUnchecked(const Build& build, workspace::WorkspaceLease& lease, artifacts::LogWriter& log,
                                     const process::CancelToken& token) const {
  const auto& request = build.request();

  auto version = catalog_->Lookup(request.vehicle(), request.version_id(), request.board());
  if (!version) {
    return Failure(ERROR_KIND_INVALID_REQUEST, "version " + request.version_id() + " for " + request.vehicle() + "/" +
                                                   request.board() + " is no longer in the catalog");
  }
  if (token.Cancelled()) return CancelledOutcome(token.Reason());

  const auto& ref = version->commit_ref().empty() ? version->id() : version->commit_ref();
  log.WriteLine("==> checkout " + ref + " in slot " + std::to_string(lease.SlotId()));
  auto commit = workspaces_->Reset(lease, ref, [&](std::string_view bytes) { log.Write(bytes); }, &token);
  if (token.Cancelled()) return CancelledOutcome(token.Reason());

  lease.MarkDirty();
  auto config = configurator_->Materialize(lease.ConfigPath(), *version, request);
  log.WriteLine("==> configuration " + config.digest + " (" + std::to_string(config.enabled.size()) + " enabled)");

  toolchain::ToolchainContext context;
  context.build_id    = build.id();
  context.vehicle     = request.vehicle();
  context.board       = request.board();
  context.commit      = commit;
  context.workspace   = lease.Root();
  context.source_dir  = lease.SourceDir();
  context.out_dir     = lease.OutDir();
  context.config_path = config.path;

  auto result = toolchain_->Run(context, log, token);
  if (result.cancelled != process::CancelReason::kNone) return CancelledOutcome(result.cancelled);
  if (!result.succeeded) {
    return Failure(ERROR_KIND_NON_ZERO_EXIT,
                   "step " + result.failed_step + " exited with " + std::to_string(result.exit_code));
  }

  auto files = toolchain_->CollectArtifacts(context);
  if (files.empty()) return Failure(ERROR_KIND_NO_ARTIFACT, "toolchain succeeded but produced no artifact");

  JobOutcome outcome;
  outcome.state = BUILD_STATE_SUCCESS;
  for (const auto& file : files) {
    auto ref_out = artifacts_->PutArtifact(build.id(), file);
    if (outcome.artifact_ref.empty()) outcome.artifact_ref = ref_out;
    log.WriteLine("==> artifact " + file.filename().string());
  }
  return outcome;
}

} // namespace fwbuild::core
