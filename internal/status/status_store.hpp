#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "fwbuild/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace fwbuild::status {

/*
  Durable record of every build's lifecycle.

  Consistency model:
  - The repository is the source of truth. Every mutation is committed
    there first; the cache is updated only after Commit() returns.
  - Readers are served from the cache under a shared lock and always see
    a whole committed snapshot of a build.
  - Mutations are serialized by one write mutex, so a read-modify-write
    of a build never interleaves with another.
  - Any failure on the write path throws util::StoreUnavailable and leaves
    the cache untouched.
*/
class StatusStore {
 public:
  using Mutator = std::function<void(fwbuild::v1::Build&)>;

  explicit StatusStore(std::shared_ptr<db::Repository> repository);

  // Loads every persisted build. Call once before anything else.
  void Hydrate();

  uint64_t NextSequence();

  void Insert(const fwbuild::v1::Build& build);

  std::optional<fwbuild::v1::Build> Get(const std::string& id) const;

  // Newest first, then offset/limit (limit 0: no limit).
  std::vector<fwbuild::v1::Build> List(const fwbuild::v1::BuildFilter& filter) const;

  // Admission order.
  std::vector<fwbuild::v1::Build> ListByState(fwbuild::v1::BuildState state) const;

  // PENDING + RUNNING.
  std::size_t CountActive() const;

  std::optional<std::string> FindActiveByHash(const std::string& request_hash) const;

  /*
    Compare-and-set state change.

    Applies `mutate` and moves the build from `expected` to `to` in one
    committed write. Returns nullopt, changing nothing, when the build is
    no longer in `expected`.

    The store maintains the field invariants itself: workspace_id only
    while RUNNING, error only on FAILURE, started_at/finished_at set on
    entry to RUNNING/terminal and never earlier than the previous stamp.

    Throws util::NotFound, util::InvalidState (transition not allowed) or
    util::StoreUnavailable.
  */
  std::optional<fwbuild::v1::Build> Transition(const std::string& id, fwbuild::v1::BuildState expected,
                                               fwbuild::v1::BuildState to, const Mutator& mutate = {});

  /*
    Startup reconciliation. No worker owns anything yet, so every RUNNING
    build becomes FAILURE{INTERRUPTED}; `mutate` may add to each of them.
    Returns the PENDING builds in admission order.
  */
  std::vector<fwbuild::v1::Build> Reconcile(const Mutator& mutate = {});

  // Removes a terminal build. Throws NotFound or InvalidState.
  void Prune(const std::string& id);

  // Latest snapshot once terminal, or whatever is current at timeout.
  std::optional<fwbuild::v1::Build> WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const;

 private:
  template <typename Fn>
  void Persist(const std::string& what, Fn&& body);

  void Publish(const fwbuild::v1::Build& build);

  std::shared_ptr<db::Repository> repository_;

  std::mutex write_mutex_;

  mutable std::shared_mutex                           cache_mutex_;
  mutable std::condition_variable_any                 cache_cv_;
  std::unordered_map<std::string, fwbuild::v1::Build> cache_;

  std::atomic<uint64_t> next_sequence_{1};
};

// Row <-> message mapping shared with tools that read the repository directly.
db::model::BuildRecord ToRecord(const fwbuild::v1::Build& build);
fwbuild::v1::Build     FromRecord(const db::model::BuildRecord& record);

} // namespace fwbuild::status
