#include "pg_repository.hpp"

namespace fwbuild::db::postgres {

namespace {

model::BuildRecord ReadBuild(const pqxx::row& row) {
  model::BuildRecord r;
  r.id             = row[0].c_str();
  r.sequence       = row[1].as<uint64_t>();
  r.vehicle        = row[2].c_str();
  r.board          = row[3].c_str();
  r.version_id     = row[4].c_str();
  r.features       = row[5].c_str();
  r.request_hash   = row[6].c_str();
  r.state          = row[7].as<int>();
  r.workspace_id   = row[8].as<int64_t>();
  r.created_at_ms  = row[9].as<uint64_t>();
  r.started_at_ms  = row[10].as<uint64_t>();
  r.finished_at_ms = row[11].as<uint64_t>();
  r.error_kind     = row[12].as<int>();
  r.error_message  = row[13].c_str();
  r.artifact_ref   = row[14].c_str();
  r.log_ref        = row[15].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertBuild(Transaction& t, const model::BuildRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_build", r.id, r.sequence, r.vehicle, r.board, r.version_id, r.features,
                               r.request_hash, r.state, r.workspace_id, r.created_at_ms, r.started_at_ms,
                               r.finished_at_ms, r.error_kind, r.error_message, r.artifact_ref, r.log_ref);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BuildRecord> PgRepository::GetBuild(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_build", id);
  if (res.empty()) return std::nullopt;
  return ReadBuild(res[0]);
}

std::vector<model::BuildRecord> PgRepository::ListBuilds(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_builds");

  std::vector<model::BuildRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadBuild(row));
  }
  return records;
}

Result PgRepository::UpdateBuild(Transaction& t, const model::BuildRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_build", r.id, r.sequence, r.vehicle, r.board, r.version_id,
                                          r.features, r.request_hash, r.state, r.workspace_id, r.created_at_ms,
                                          r.started_at_ms, r.finished_at_ms, r.error_kind, r.error_message,
                                          r.artifact_ref, r.log_ref);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBuild(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_build", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::MaxSequence(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("max_sequence");
  return res[0][0].as<uint64_t>();
}

}
