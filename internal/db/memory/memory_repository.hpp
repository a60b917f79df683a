#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fwbuild::db::memory {

class MemoryTransaction;

/*
  Process-local repository. Not durable across restarts; used by tests and
  by deployments that accept losing history.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBuild(Transaction&, const model::BuildRecord&) override;
  std::optional<model::BuildRecord> GetBuild(Transaction&, const std::string&) override;
  std::vector<model::BuildRecord> ListBuilds(Transaction&) override;
  Result UpdateBuild(Transaction&, const model::BuildRecord&) override;
  Result DeleteBuild(Transaction&, const std::string&) override;
  uint64_t MaxSequence(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BuildRecord> builds;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace fwbuild::db::memory
