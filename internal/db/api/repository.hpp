#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/build_record.hpp"

namespace fwbuild::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A committed write is durable before Commit() returns
  - Build state correctness depends on this behavior

  The DB is the source of truth for build lifecycle state. The status
  store caches it but never publishes a change the DB has not committed.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Builds
  // ---------------------------------------------------------------------

  virtual Result InsertBuild(Transaction&, const model::BuildRecord&) = 0;

  virtual std::optional<model::BuildRecord> GetBuild(Transaction&, const std::string& id) = 0;

  // Ordered by sequence (admission order).
  virtual std::vector<model::BuildRecord> ListBuilds(Transaction&) = 0;

  virtual Result UpdateBuild(Transaction&, const model::BuildRecord&) = 0;

  virtual Result DeleteBuild(Transaction&, const std::string& id) = 0;

  // 0 when no build was ever admitted.
  virtual uint64_t MaxSequence(Transaction&) = 0;
};

} // namespace fwbuild::db
