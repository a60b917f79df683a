#include "internal/status/status_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/hooked_repository.hpp"

namespace {

using namespace fwbuild::v1;
using fwbuild::status::StatusStore;
using fwbuild::testing::HookedRepository;

Build MakeBuild(StatusStore& store, const std::string& id, const std::string& hash = "h") {
  Build build;
  build.set_id(id);
  build.set_sequence(store.NextSequence());
  build.mutable_request()->set_vehicle("copter");
  build.mutable_request()->set_board("SPEDIXF405");
  build.mutable_request()->set_version_id("stable-4.5");
  build.mutable_request()->add_features("AP_GPS_ENABLED");
  build.mutable_request()->add_features("HAL_EXTERNAL_AHRS_ENABLED");
  build.set_request_hash(hash);
  build.set_state(BUILD_STATE_PENDING);
  *build.mutable_created_at() = fwbuild::util::NowProto();
  return build;
}

void TestLifecycleInvariants() {
  auto        repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  StatusStore store(repo);
  store.Hydrate();

  store.Insert(MakeBuild(store, "b1"));
  assert(store.CountActive() == 1);

  auto running = store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_RUNNING, [](Build& b) { b.set_workspace_id(2); });
  assert(running.has_value());
  assert(running->has_workspace_id() && running->workspace_id() == 2);
  assert(running->has_started_at());
  assert(!running->has_finished_at());

  auto failed = store.Transition("b1", BUILD_STATE_RUNNING, BUILD_STATE_FAILURE, [](Build& b) {
    b.mutable_error()->set_kind(ERROR_KIND_NON_ZERO_EXIT);
    b.mutable_error()->set_message("step build exited with 1");
  });
  assert(failed.has_value());
  assert(!failed->has_workspace_id());
  assert(failed->has_finished_at());
  assert(fwbuild::util::ToUnixMillis(failed->finished_at()) >= fwbuild::util::ToUnixMillis(failed->started_at()));
  assert(failed->error().kind() == ERROR_KIND_NON_ZERO_EXIT);
  assert(store.CountActive() == 0);

  // terminal is final
  bool threw = false;
  try {
    (void)store.Transition("b1", BUILD_STATE_FAILURE, BUILD_STATE_RUNNING);
  } catch (const fwbuild::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestCompareAndSetLosesQuietly() {
  auto        repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  StatusStore store(repo);
  store.Hydrate();

  store.Insert(MakeBuild(store, "b1"));
  assert(store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_CANCELLED).has_value());

  // a worker that dequeued it before the cancel loses the race
  assert(!store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_RUNNING).has_value());
  assert(store.Get("b1")->state() == BUILD_STATE_CANCELLED);
  assert(!store.Get("b1")->has_error());

  bool threw = false;
  try {
    (void)store.Transition("missing", BUILD_STATE_PENDING, BUILD_STATE_RUNNING);
  } catch (const fwbuild::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListOrderingAndFilters() {
  auto        repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  StatusStore store(repo);
  store.Hydrate();

  for (int i = 0; i < 5; ++i) {
    auto build = MakeBuild(store, "b" + std::to_string(i));
    if (i % 2 == 1) build.mutable_request()->set_board("MatekH743");
    store.Insert(build);
  }
  assert(store.Transition("b0", BUILD_STATE_PENDING, BUILD_STATE_CANCELLED).has_value());

  auto all = store.List(BuildFilter{});
  assert(all.size() == 5);
  assert(all.front().id() == "b4");
  assert(all.back().id() == "b0");

  BuildFilter page;
  page.set_offset(1);
  page.set_limit(2);
  auto paged = store.List(page);
  assert(paged.size() == 2);
  assert(paged[0].id() == "b3");
  assert(paged[1].id() == "b2");

  BuildFilter by_board;
  by_board.set_board("MatekH743");
  assert(store.List(by_board).size() == 2);

  BuildFilter by_state;
  by_state.set_state(BUILD_STATE_CANCELLED);
  assert(store.List(by_state).size() == 1);

  auto pending = store.ListByState(BUILD_STATE_PENDING);
  assert(pending.size() == 4);
  assert(pending.front().id() == "b1");
}

void TestHydrateAndReconcile() {
  auto repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  {
    StatusStore store(repo);
    store.Hydrate();
    store.Insert(MakeBuild(store, "running"));
    store.Insert(MakeBuild(store, "queued"));
    store.Insert(MakeBuild(store, "done"));
    (void)store.Transition("running", BUILD_STATE_PENDING, BUILD_STATE_RUNNING, [](Build& b) { b.set_workspace_id(0); });
    (void)store.Transition("done", BUILD_STATE_PENDING, BUILD_STATE_RUNNING);
    (void)store.Transition("done", BUILD_STATE_RUNNING, BUILD_STATE_SUCCESS, [](Build& b) { b.set_artifact_ref("done/artifacts/fw.apj"); });
  }

  StatusStore restarted(repo);
  restarted.Hydrate();
  assert(restarted.Get("done")->progress_percent() == 100);
  assert(restarted.Get("queued")->request().features_size() == 2);
  assert(restarted.NextSequence() == 4);

  auto pending = restarted.Reconcile([](Build& b) { b.set_log_ref(b.id() + "/build.log"); });
  assert(pending.size() == 1);
  assert(pending[0].id() == "queued");

  auto interrupted = restarted.Get("running");
  assert(interrupted->state() == BUILD_STATE_FAILURE);
  assert(interrupted->error().kind() == ERROR_KIND_INTERRUPTED);
  assert(interrupted->log_ref() == "running/build.log");
  assert(!interrupted->has_workspace_id());
}

void TestDeduplicationLookup() {
  auto        repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  StatusStore store(repo);
  store.Hydrate();

  store.Insert(MakeBuild(store, "first", "same"));
  store.Insert(MakeBuild(store, "second", "same"));
  assert(*store.FindActiveByHash("same") == "first");

  (void)store.Transition("first", BUILD_STATE_PENDING, BUILD_STATE_CANCELLED);
  assert(*store.FindActiveByHash("same") == "second");
  assert(!store.FindActiveByHash("other").has_value());
}

void TestWriteFailureLeavesCacheUntouched() {
  auto        hooked = std::make_shared<HookedRepository>(std::make_shared<fwbuild::db::memory::MemoryRepository>());
  StatusStore store(hooked);
  store.Hydrate();
  store.Insert(MakeBuild(store, "b1"));

  hooked->FailWrites(true);
  bool threw = false;
  try {
    (void)store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_RUNNING);
  } catch (const fwbuild::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(store.Get("b1")->state() == BUILD_STATE_PENDING);

  threw = false;
  try {
    store.Insert(MakeBuild(store, "b2"));
  } catch (const fwbuild::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!store.Get("b2").has_value());

  hooked->FailWrites(false);
  hooked->FailBegin(true);
  threw = false;
  try {
    (void)store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_CANCELLED);
  } catch (const fwbuild::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(store.Get("b1")->state() == BUILD_STATE_PENDING);
}

void TestPruneOnlyTerminal() {
  auto        repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  StatusStore store(repo);
  store.Hydrate();
  store.Insert(MakeBuild(store, "b1"));

  bool threw = false;
  try {
    store.Prune("b1");
  } catch (const fwbuild::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  (void)store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_CANCELLED);
  store.Prune("b1");
  assert(!store.Get("b1").has_value());

  StatusStore reloaded(repo);
  reloaded.Hydrate();
  assert(!reloaded.Get("b1").has_value());
}

void TestWaitForTerminal() {
  auto        repo = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  StatusStore store(repo);
  store.Hydrate();
  store.Insert(MakeBuild(store, "b1"));

  auto early = store.WaitForTerminal("b1", std::chrono::milliseconds(20));
  assert(early.has_value() && early->state() == BUILD_STATE_PENDING);

  std::thread finisher([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    (void)store.Transition("b1", BUILD_STATE_PENDING, BUILD_STATE_CANCELLED);
  });
  auto done = store.WaitForTerminal("b1", std::chrono::seconds(5));
  finisher.join();

  assert(done.has_value() && done->state() == BUILD_STATE_CANCELLED);
  assert(!store.WaitForTerminal("missing", std::chrono::milliseconds(1)).has_value());
}

} // namespace

int main() {
  TestLifecycleInvariants();
  TestCompareAndSetLosesQuietly();
  TestListOrderingAndFilters();
  TestHydrateAndReconcile();
  TestDeduplicationLookup();
  TestWriteFailureLeavesCacheUntouched();
  TestPruneOnlyTerminal();
  TestWaitForTerminal();

  std::cout << "fwbuild_unit_status_store: pass\n";
  return 0;
}
