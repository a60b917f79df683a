#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace fwbuild::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBuild(Transaction&, const model::BuildRecord&) override;
  std::optional<model::BuildRecord> GetBuild(Transaction&, const std::string&) override;
  std::vector<model::BuildRecord> ListBuilds(Transaction&) override;
  Result UpdateBuild(Transaction&, const model::BuildRecord&) override;
  Result DeleteBuild(Transaction&, const std::string&) override;
  uint64_t MaxSequence(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
