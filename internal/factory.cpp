#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/artifacts/artifact_store.hpp"
#include "internal/catalog/file_catalog.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/configurator/build_configurator.hpp"
#include "internal/core/build_orchestrator.hpp"
#include "internal/core/build_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/status/status_store.hpp"
#include "internal/toolchain/toolchain_runner.hpp"
#include "internal/util/time.hpp"
#include "internal/workspace/git_source_control.hpp"
#include "internal/workspace/workspace_pool.hpp"
#if FWBUILD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FWBUILD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace fwbuild::factory {

using namespace fwbuild;

namespace {

#if FWBUILD_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::CREATE_BUILDS);
  sqlite_db->Exec(db::sql::CREATE_BUILDS_STATE_INDEX);

  sqlite_db->Exec("SELECT " FWBUILD_BUILD_COLUMNS " FROM builds LIMIT 1;");
}
#endif

#if FWBUILD_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS builds ("
      " id TEXT PRIMARY KEY,"
      " sequence BIGINT NOT NULL UNIQUE,"
      " vehicle TEXT NOT NULL,"
      " board TEXT NOT NULL,"
      " version_id TEXT NOT NULL,"
      " features TEXT NOT NULL,"
      " request_hash TEXT NOT NULL,"
      " state SMALLINT NOT NULL,"
      " workspace_id BIGINT NOT NULL DEFAULT -1,"
      " created_at_ms BIGINT NOT NULL,"
      " started_at_ms BIGINT NOT NULL DEFAULT 0,"
      " finished_at_ms BIGINT NOT NULL DEFAULT 0,"
      " error_kind SMALLINT NOT NULL DEFAULT 0,"
      " error_message TEXT NOT NULL DEFAULT '',"
      " artifact_ref TEXT NOT NULL DEFAULT '',"
      " log_ref TEXT NOT NULL DEFAULT '');");
  tx.exec(db::sql::CREATE_BUILDS_STATE_INDEX);

  tx.exec("SELECT " FWBUILD_BUILD_COLUMNS " FROM builds LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const fwbuild::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FWBUILD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().synchronous_full());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FWBUILD_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections();
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       max_connections == 0 ? 4 : max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const fwbuild::runtime::config::RuntimeConfig& config) {
  config::ConfigLoader::Validate(config);

  Application app;

  // ------------------------------------------------------------------
  // Status store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.status     = std::make_shared<status::StatusStore>(app.repository);

  // ------------------------------------------------------------------
  // Workspaces, catalog, artifacts
  // ------------------------------------------------------------------
  auto cancel_grace = util::ToMillis(config.queue().cancel_grace());
  if (cancel_grace.count() <= 0) cancel_grace = std::chrono::seconds(10);

  const auto& ws      = config.workspaces();
  auto source_control = std::make_shared<workspace::GitSourceControl>(ws.mirror_path(), ws.git_binary(),
                                                                      ws.update_submodules(), cancel_grace);
  app.workspaces      = std::make_shared<workspace::WorkspacePool>(ws.root(), ws.count(), std::move(source_control));
  app.catalog         = std::make_shared<catalog::FileCatalog>(config.catalog().path());
  app.artifacts       = std::make_shared<artifacts::ArtifactStore>(config.artifacts().root());

  // ------------------------------------------------------------------
  // Build pipeline
  // ------------------------------------------------------------------
  auto configurator = std::make_shared<configurator::BuildConfigurator>();
  auto toolchain    = std::make_shared<toolchain::ToolchainRunner>(config.toolchain(), cancel_grace);
  auto runner = std::make_shared<core::BuildRunner>(app.workspaces, app.catalog, configurator, toolchain, app.artifacts);

  core::OrchestratorOptions options;
  options.max_in_flight = config.queue().max_in_flight();
  options.build_timeout = util::ToMillis(config.queue().build_timeout());
  options.deduplicate   = config.queue().deduplicate();

  app.orchestrator = std::make_shared<core::BuildOrchestrator>(options, app.status, app.workspaces, app.catalog,
                                                               app.artifacts, std::move(runner));
  return app;
}

} // namespace fwbuild::factory
