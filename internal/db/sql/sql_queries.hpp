#pragma once

namespace fwbuild::db::sql {

/*
  Canonical SQL for the builds table.

  Written in the SQLite dialect. The Postgres backend prepares its own
  $n-parameter copies of the same statements in PgPool.
*/

static constexpr const char* CREATE_BUILDS =
    "CREATE TABLE IF NOT EXISTS builds ("
    " id TEXT PRIMARY KEY,"
    " sequence INTEGER NOT NULL UNIQUE,"
    " vehicle TEXT NOT NULL,"
    " board TEXT NOT NULL,"
    " version_id TEXT NOT NULL,"
    " features TEXT NOT NULL,"
    " request_hash TEXT NOT NULL,"
    " state INTEGER NOT NULL,"
    " workspace_id INTEGER NOT NULL DEFAULT -1,"
    " created_at_ms INTEGER NOT NULL,"
    " started_at_ms INTEGER NOT NULL DEFAULT 0,"
    " finished_at_ms INTEGER NOT NULL DEFAULT 0,"
    " error_kind INTEGER NOT NULL DEFAULT 0,"
    " error_message TEXT NOT NULL DEFAULT '',"
    " artifact_ref TEXT NOT NULL DEFAULT '',"
    " log_ref TEXT NOT NULL DEFAULT '');";

static constexpr const char* CREATE_BUILDS_STATE_INDEX =
    "CREATE INDEX IF NOT EXISTS builds_state_idx ON builds(state);";

#define FWBUILD_BUILD_COLUMNS                                                                  \
  "id,sequence,vehicle,board,version_id,features,request_hash,state,workspace_id,"             \
  "created_at_ms,started_at_ms,finished_at_ms,error_kind,error_message,artifact_ref,log_ref"

static constexpr const char* INSERT_BUILD =
    "INSERT INTO builds(" FWBUILD_BUILD_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BUILD =
    "SELECT " FWBUILD_BUILD_COLUMNS " FROM builds WHERE id=?;";

static constexpr const char* SELECT_BUILDS =
    "SELECT " FWBUILD_BUILD_COLUMNS " FROM builds ORDER BY sequence ASC;";

// id is bound last
static constexpr const char* UPDATE_BUILD =
    "UPDATE builds SET sequence=?,vehicle=?,board=?,version_id=?,features=?,request_hash=?,"
    "state=?,workspace_id=?,created_at_ms=?,started_at_ms=?,finished_at_ms=?,"
    "error_kind=?,error_message=?,artifact_ref=?,log_ref=? WHERE id=?;";

static constexpr const char* DELETE_BUILD =
    "DELETE FROM builds WHERE id=?;";

static constexpr const char* SELECT_MAX_SEQUENCE =
    "SELECT COALESCE(MAX(sequence),0) FROM builds;";

} // namespace fwbuild::db::sql
