#pragma once

#include <memory>
#include <string>

#include "fwbuild/v1.hpp"
#include "internal/process/cancel_token.hpp"

namespace fwbuild::artifacts {
class ArtifactStore;
class LogWriter;
} // namespace fwbuild::artifacts
namespace fwbuild::catalog {
class MetadataCatalog;
}
namespace fwbuild::configurator {
class BuildConfigurator;
}
namespace fwbuild::toolchain {
class ToolchainRunner;
}
namespace fwbuild::workspace {
class WorkspaceLease;
class WorkspacePool;
} // namespace fwbuild::workspace

namespace fwbuild::core {

struct JobOutcome {
  fwbuild::v1::BuildState state      = fwbuild::v1::BUILD_STATE_FAILURE;
  fwbuild::v1::ErrorKind  error_kind = fwbuild::v1::ERROR_KIND_UNSPECIFIED;
  std::string             error_message;
  std::string             artifact_ref;
};

/*
  Executes one leased build:

    reset workspace -> materialize configuration -> toolchain -> artifacts

  Never throws. Every failure is classified into the returned outcome and
  written to the build log. The token bounds the checkout as well as the
  toolchain.
*/
class BuildRunner {
 public:
  BuildRunner(std::shared_ptr<workspace::WorkspacePool> workspaces, std::shared_ptr<catalog::MetadataCatalog> catalog,
              std::shared_ptr<configurator::BuildConfigurator> configurator,
              std::shared_ptr<toolchain::ToolchainRunner> toolchain, std::shared_ptr<artifacts::ArtifactStore> artifacts);

  JobOutcome Run(const fwbuild::v1::Build& build, workspace::WorkspaceLease& lease, artifacts::LogWriter& log,
                 const process::CancelToken& token) const;

  // CANCELLED for a user cancel; FAILURE{TIMEOUT|INTERRUPTED} otherwise.
  static JobOutcome CancelledOutcome(process::CancelReason reason);

 private:
  JobOutcome RunUnchecked(const fwbuild::v1::Build& build, workspace::WorkspaceLease& lease, artifacts::LogWriter& log,
                          const process::CancelToken& token) const;

  std::shared_ptr<workspace::WorkspacePool>        workspaces_;
  std::shared_ptr<catalog::MetadataCatalog>        catalog_;
  std::shared_ptr<configurator::BuildConfigurator> configurator_;
  std::shared_ptr<toolchain::ToolchainRunner>      toolchain_;
  std::shared_ptr<artifacts::ArtifactStore>        artifacts_;
};

} // namespace fwbuild::core
