#include "internal/status/status_store.hpp"

#include <algorithm>
#include <sstream>

#include "internal/model/build_request.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fwbuild::status {

using namespace fwbuild::v1;
using fwbuild::observability::StringField;

// ------------------------------------------------------------------
// Record mapping
// ------------------------------------------------------------------

db::model::BuildRecord ToRecord(const Build& build) {
  db::model::BuildRecord r;
  r.id         = build.id();
  r.sequence   = build.sequence();
  r.vehicle    = build.request().vehicle();
  r.board      = build.request().board();
  r.version_id = build.request().version_id();
  for (const auto& feature : build.request().features()) {
    if (!r.features.empty()) r.features.push_back('\n');
    r.features += feature;
  }
  r.request_hash   = build.request_hash();
  r.state          = static_cast<int>(build.state());
  r.workspace_id   = build.has_workspace_id() ? static_cast<int64_t>(build.workspace_id()) : -1;
  r.created_at_ms  = build.has_created_at() ? util::ToUnixMillis(build.created_at()) : 0;
  r.started_at_ms  = build.has_started_at() ? util::ToUnixMillis(build.started_at()) : 0;
  r.finished_at_ms = build.has_finished_at() ? util::ToUnixMillis(build.finished_at()) : 0;
  if (build.has_error()) {
    r.error_kind    = static_cast<int>(build.error().kind());
    r.error_message = build.error().message();
  }
  r.artifact_ref = build.artifact_ref();
  r.log_ref      = build.log_ref();
  return r;
}

Build FromRecord(const db::model::BuildRecord& r) {
  Build build;
  build.set_id(r.id);
  build.set_sequence(r.sequence);

  auto* request = build.mutable_request();
  request->set_vehicle(r.vehicle);
  request->set_board(r.board);
  request->set_version_id(r.version_id);
  std::istringstream features(r.features);
  for (std::string feature; std::getline(features, feature);) {
    if (!feature.empty()) request->add_features(feature);
  }

  build.set_request_hash(r.request_hash);
  build.set_state(static_cast<BuildState>(r.state));
  if (r.workspace_id >= 0) build.set_workspace_id(static_cast<uint32_t>(r.workspace_id));
  if (r.created_at_ms) *build.mutable_created_at() = util::TimestampFromUnixMillis(r.created_at_ms);
  if (r.started_at_ms) *build.mutable_started_at() = util::TimestampFromUnixMillis(r.started_at_ms);
  if (r.finished_at_ms) *build.mutable_finished_at() = util::TimestampFromUnixMillis(r.finished_at_ms);
  if (r.error_kind != 0) {
    build.mutable_error()->set_kind(static_cast<ErrorKind>(r.error_kind));
    build.mutable_error()->set_message(r.error_message);
  }
  build.set_artifact_ref(r.artifact_ref);
  build.set_log_ref(r.log_ref);
  if (build.state() == BUILD_STATE_SUCCESS) build.set_progress_percent(100);
  return build;
}

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  throw util::StoreUnavailable(context + ": " + db::ToString(result.code) +
                               (result.message.empty() ? "" : " (" + result.message + ")"));
}

// Stamps never move backwards relative to the previous lifecycle stamp.
void ClampTimestamps(Build& build) {
  if (build.has_started_at() && build.has_created_at() &&
      util::ToUnixMillis(build.started_at()) < util::ToUnixMillis(build.created_at())) {
    *build.mutable_started_at() = build.created_at();
  }
  if (build.has_finished_at()) {
    const auto& floor = build.has_started_at() ? build.started_at() : build.created_at();
    if (util::ToUnixMillis(build.finished_at()) < util::ToUnixMillis(floor)) {
      *build.mutable_finished_at() = floor;
    }
  }
}

bool Matches(const Build& build, const BuildFilter& filter) {
  if (!filter.vehicle().empty() && build.request().vehicle() != filter.vehicle()) return false;
  if (!filter.board().empty() && build.request().board() != filter.board()) return false;
  if (filter.state() != BUILD_STATE_UNSPECIFIED && build.state() != filter.state()) return false;
  return true;
}

} // namespace

// ------------------------------------------------------------------
// StatusStore
// ------------------------------------------------------------------

StatusStore::StatusStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

template <typename Fn>
void StatusStore::Persist(const std::string& what, Fn&& body) {
  try {
    auto tx = repository_->Begin();
    body(*tx);
    tx->Commit();
  } catch (const util::StoreUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreUnavailable(what + ": " + e.what());
  }
}

void StatusStore::Publish(const Build& build) {
  {
    std::unique_lock lock(cache_mutex_);
    cache_[build.id()] = build;
  }
  cache_cv_.notify_all();
}

void StatusStore::Hydrate() {
  std::lock_guard write_lock(write_mutex_);

  std::vector<db::model::BuildRecord> records;
  uint64_t                            max_sequence = 0;
  Persist("hydrate", [&](db::Transaction& tx) {
    records      = repository_->ListBuilds(tx);
    max_sequence = repository_->MaxSequence(tx);
  });

  {
    std::unique_lock lock(cache_mutex_);
    cache_.clear();
    for (const auto& record : records) {
      cache_[record.id] = FromRecord(record);
    }
  }
  next_sequence_ = max_sequence + 1;

  FWBUILD_LOG_INFO("status store hydrated", {observability::IntField("builds", static_cast<int64_t>(records.size()))});
}

uint64_t StatusStore::NextSequence() {
  return next_sequence_.fetch_add(1);
}

void StatusStore::Insert(const Build& build) {
  std::lock_guard write_lock(write_mutex_);

  Persist("insert build " + build.id(), [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->InsertBuild(tx, ToRecord(build)), "insert build " + build.id());
  });
  Publish(build);
}

std::optional<Build> StatusStore::Get(const std::string& id) const {
  std::shared_lock lock(cache_mutex_);
  auto             it = cache_.find(id);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

std::vector<Build> StatusStore::List(const BuildFilter& filter) const {
  std::vector<Build> matched;
  {
    std::shared_lock lock(cache_mutex_);
    for (const auto& [_, build] : cache_) {
      if (Matches(build, filter)) matched.push_back(build);
    }
  }
  std::sort(matched.begin(), matched.end(), [](const Build& a, const Build& b) { return a.sequence() > b.sequence(); });

  const std::size_t offset = std::min<std::size_t>(filter.offset(), matched.size());
  std::size_t       end    = matched.size();
  if (filter.limit() > 0) end = std::min<std::size_t>(end, offset + filter.limit());

  return {std::make_move_iterator(matched.begin() + offset), std::make_move_iterator(matched.begin() + end)};
}

std::vector<Build> StatusStore::ListByState(BuildState state) const {
  std::vector<Build> out;
  {
    std::shared_lock lock(cache_mutex_);
    for (const auto& [_, build] : cache_) {
      if (build.state() == state) out.push_back(build);
    }
  }
  std::sort(out.begin(), out.end(), [](const Build& a, const Build& b) { return a.sequence() < b.sequence(); });
  return out;
}

std::size_t StatusStore::CountActive() const {
  std::shared_lock lock(cache_mutex_);
  return static_cast<std::size_t>(
      std::count_if(cache_.begin(), cache_.end(), [](const auto& entry) { return model::IsActive(entry.second.state()); }));
}

std::optional<std::string> StatusStore::FindActiveByHash(const std::string& request_hash) const {
  std::shared_lock     lock(cache_mutex_);
  const Build*         oldest = nullptr;
  for (const auto& [_, build] : cache_) {
    if (!model::IsActive(build.state()) || build.request_hash() != request_hash) continue;
    if (!oldest || build.sequence() < oldest->sequence()) oldest = &build;
  }
  if (!oldest) return std::nullopt;
  return oldest->id();
}

std::optional<Build> StatusStore::Transition(const std::string& id, BuildState expected, BuildState to,
                                             const Mutator& mutate) {
  if (!model::CanTransition(expected, to)) {
    throw util::InvalidState("transition " + std::string(model::StateName(expected)) + " -> " +
                             model::StateName(to) + " is not allowed");
  }

  std::lock_guard write_lock(write_mutex_);

  auto current = Get(id);
  if (!current) throw util::NotFound("build " + id + " not found");
  if (current->state() != expected) return std::nullopt;

  Build next = *current;
  if (mutate) mutate(next);

  next.set_state(to);
  if (to == BUILD_STATE_RUNNING) {
    if (!next.has_started_at()) *next.mutable_started_at() = util::NowProto();
  } else {
    next.clear_workspace_id();
  }
  if (model::IsTerminal(to) && !next.has_finished_at()) *next.mutable_finished_at() = util::NowProto();
  if (to != BUILD_STATE_FAILURE) next.clear_error();
  next.set_progress_percent(to == BUILD_STATE_SUCCESS ? 100 : 0);
  ClampTimestamps(next);

  Persist("update build " + id,
          [&](db::Transaction& tx) { ThrowIfDbError(repository_->UpdateBuild(tx, ToRecord(next)), "update build " + id); });
  Publish(next);

  FWBUILD_LOG_INFO("build transition", {StringField("build_id", id), StringField("from", model::StateName(expected)),
                                        StringField("to", model::StateName(to))});
  return next;
}

std::vector<Build> StatusStore::Reconcile(const Mutator& mutate) {
  for (const auto& build : ListByState(BUILD_STATE_RUNNING)) {
    auto updated = Transition(build.id(), BUILD_STATE_RUNNING, BUILD_STATE_FAILURE, [&](Build& b) {
      if (mutate) mutate(b);
      b.mutable_error()->set_kind(ERROR_KIND_INTERRUPTED);
      b.mutable_error()->set_message("build was running when the orchestrator stopped");
    });
    if (updated) {
      FWBUILD_LOG_WARN("interrupted build reconciled", {StringField("build_id", build.id())});
    }
  }
  return ListByState(BUILD_STATE_PENDING);
}

void StatusStore::Prune(const std::string& id) {
  std::lock_guard write_lock(write_mutex_);

  auto current = Get(id);
  if (!current) throw util::NotFound("build " + id + " not found");
  if (!model::IsTerminal(current->state())) {
    throw util::InvalidState("build " + id + " is " + model::StateName(current->state()) + "; only terminal builds can be pruned");
  }

  Persist("delete build " + id,
          [&](db::Transaction& tx) { ThrowIfDbError(repository_->DeleteBuild(tx, id), "delete build " + id); });
  {
    std::unique_lock lock(cache_mutex_);
    cache_.erase(id);
  }
  cache_cv_.notify_all();
}

std::optional<Build> StatusStore::WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const {
  std::shared_lock lock(cache_mutex_);
  auto             done = [&] {
    auto it = cache_.find(id);
    return it == cache_.end() || model::IsTerminal(it->second.state());
  };
  cache_cv_.wait_for(lock, timeout, done);

  auto it = cache_.find(id);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

} // namespace fwbuild::status
