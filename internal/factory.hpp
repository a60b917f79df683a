#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace fwbuild::artifacts {
class ArtifactStore;
}
namespace fwbuild::catalog {
class MetadataCatalog;
}
namespace fwbuild::core {
class BuildOrchestrator;
}
namespace fwbuild::status {
class StatusStore;
}
namespace fwbuild::workspace {
class WorkspacePool;
}

namespace fwbuild::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process; the orchestrator is not started yet.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<status::StatusStore>      status;
  std::shared_ptr<workspace::WorkspacePool> workspaces;
  std::shared_ptr<catalog::MetadataCatalog> catalog;
  std::shared_ptr<artifacts::ArtifactStore> artifacts;
  std::shared_ptr<core::BuildOrchestrator>  orchestrator;
};

/*
  Opens the configured status store backend and bootstraps its schema.

  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const fwbuild::runtime::config::RuntimeConfig& config);

// Composition root. Validates the config first.
Application Build(const fwbuild::runtime::config::RuntimeConfig& config);

} // namespace fwbuild::factory
