#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

#include "internal/db/api/repository.hpp"

namespace fwbuild::testing {

/*
  Forwards to a real repository until told to fail; afterwards every write
  returns IOError and every Begin throws, the way a full disk or a dropped
  database connection would look.
*/
class HookedRepository final : public db::Repository {
 public:
  explicit HookedRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void FailWrites(bool fail) {
    fail_writes_ = fail;
  }

  void FailBegin(bool fail) {
    fail_begin_ = fail;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    if (fail_begin_) throw std::runtime_error("database unreachable");
    return inner_->Begin();
  }

  db::Result InsertBuild(db::Transaction& tx, const db::model::BuildRecord& record) override {
    if (fail_writes_) return db::Result::Err(db::ErrorCode::IOError, "disk full");
    return inner_->InsertBuild(tx, record);
  }

  std::optional<db::model::BuildRecord> GetBuild(db::Transaction& tx, const std::string& id) override {
    return inner_->GetBuild(tx, id);
  }

  std::vector<db::model::BuildRecord> ListBuilds(db::Transaction& tx) override {
    return inner_->ListBuilds(tx);
  }

  db::Result UpdateBuild(db::Transaction& tx, const db::model::BuildRecord& record) override {
    if (fail_writes_) return db::Result::Err(db::ErrorCode::IOError, "disk full");
    return inner_->UpdateBuild(tx, record);
  }

  db::Result DeleteBuild(db::Transaction& tx, const std::string& id) override {
    if (fail_writes_) return db::Result::Err(db::ErrorCode::IOError, "disk full");
    return inner_->DeleteBuild(tx, id);
  }

  uint64_t MaxSequence(db::Transaction& tx) override {
    return inner_->MaxSequence(tx);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
  std::atomic<bool>               fail_writes_{false};
  std::atomic<bool>               fail_begin_{false};
};

} // namespace fwbuild::testing
