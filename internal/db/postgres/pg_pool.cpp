#include "pg_pool.hpp"

namespace fwbuild::db::postgres {

#define FWBUILD_PG_BUILD_COLUMNS                                                               \
  "id,sequence,vehicle,board,version_id,features,request_hash,state,workspace_id,"             \
  "created_at_ms,started_at_ms,finished_at_ms,error_kind,error_message,artifact_ref,log_ref"

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_build", "SELECT " FWBUILD_PG_BUILD_COLUMNS " FROM builds WHERE id=$1");

  conn.prepare("list_builds", "SELECT " FWBUILD_PG_BUILD_COLUMNS " FROM builds ORDER BY sequence ASC");

  conn.prepare("insert_build",
               "INSERT INTO builds(" FWBUILD_PG_BUILD_COLUMNS ") "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)");

  conn.prepare("update_build",
               "UPDATE builds SET sequence=$2,vehicle=$3,board=$4,version_id=$5,features=$6,"
               "request_hash=$7,state=$8,workspace_id=$9,created_at_ms=$10,started_at_ms=$11,"
               "finished_at_ms=$12,error_kind=$13,error_message=$14,artifact_ref=$15,log_ref=$16 "
               "WHERE id=$1");

  conn.prepare("delete_build", "DELETE FROM builds WHERE id=$1");

  conn.prepare("max_sequence", "SELECT COALESCE(MAX(sequence),0) FROM builds");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace fwbuild::db::postgres
