#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace fwbuild::db::sqlite {

using fwbuild::db::ErrorCode;
using fwbuild::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* st = nullptr;
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Binds every column except id, starting at `first`. Column order matches
// FWBUILD_BUILD_COLUMNS minus the leading id.
int BindBuildFields(sqlite3_stmt* st, int first, const model::BuildRecord& r) {
    int i = first;
    BindU64(st, i++, r.sequence);
    BindText(st, i++, r.vehicle);
    BindText(st, i++, r.board);
    BindText(st, i++, r.version_id);
    BindText(st, i++, r.features);
    BindText(st, i++, r.request_hash);
    BindI32(st, i++, r.state);
    BindI64(st, i++, r.workspace_id);
    BindU64(st, i++, r.created_at_ms);
    BindU64(st, i++, r.started_at_ms);
    BindU64(st, i++, r.finished_at_ms);
    BindI32(st, i++, r.error_kind);
    BindText(st, i++, r.error_message);
    BindText(st, i++, r.artifact_ref);
    BindText(st, i++, r.log_ref);
    return i;
}

model::BuildRecord ReadBuild(sqlite3_stmt* st) {
    model::BuildRecord r;
    r.id             = ColText(st, 0);
    r.sequence       = ColU64(st, 1);
    r.vehicle        = ColText(st, 2);
    r.board          = ColText(st, 3);
    r.version_id     = ColText(st, 4);
    r.features       = ColText(st, 5);
    r.request_hash   = ColText(st, 6);
    r.state          = ColI32(st, 7);
    r.workspace_id   = ColI64(st, 8);
    r.created_at_ms  = ColU64(st, 9);
    r.started_at_ms  = ColU64(st, 10);
    r.finished_at_ms = ColU64(st, 11);
    r.error_kind     = ColI32(st, 12);
    r.error_message  = ColText(st, 13);
    r.artifact_ref   = ColText(st, 14);
    r.log_ref        = ColText(st, 15);
    return r;
}

void PrepareOrThrow(sqlite3* db, const char* sql, Statement& stmt) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Builds
// ------------------------------------------------------------------

Result SqliteRepository::InsertBuild(Transaction& t, const model::BuildRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::INSERT_BUILD, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindBuildFields(stmt.st, 2, r);

    int rc = sqlite3_step(stmt.st);
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    return Translate(db, rc);
}

std::optional<model::BuildRecord>
SqliteRepository::GetBuild(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_BUILD, stmt);
    BindText(stmt.st, 1, id);

    int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite select build: ") + sqlite3_errmsg(db));

    return ReadBuild(stmt.st);
}

std::vector<model::BuildRecord> SqliteRepository::ListBuilds(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_BUILDS, stmt);

    std::vector<model::BuildRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(ReadBuild(stmt.st));
    }
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite select builds: ") + sqlite3_errmsg(db));

    return out;
}

Result SqliteRepository::UpdateBuild(Transaction& t, const model::BuildRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::UPDATE_BUILD, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int next = BindBuildFields(stmt.st, 1, r);
    BindText(stmt.st, next, r.id);

    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
}

Result SqliteRepository::DeleteBuild(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::DELETE_BUILD, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, id);

    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
}

uint64_t SqliteRepository::MaxSequence(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_MAX_SEQUENCE, stmt);

    if (sqlite3_step(stmt.st) != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite max sequence: ") + sqlite3_errmsg(db));
    return ColU64(stmt.st, 0);
}

} // namespace fwbuild::db::sqlite
