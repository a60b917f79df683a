#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/time.hpp"
#include "tests/support/orchestrator_harness.hpp"

namespace {

namespace fs = std::filesystem;
using namespace fwbuild::v1;
using fwbuild::testing::HarnessOptions;
using fwbuild::testing::MakeHarness;
using fwbuild::testing::MakeRequest;
using fwbuild::testing::MakeRoot;
using fwbuild::testing::WaitForProgress;

Build WaitTerminal(fwbuild::core::BuildOrchestrator& orchestrator, const std::string& id) {
  auto build = orchestrator.WaitForTerminal(id, std::chrono::seconds(30));
  assert(build.has_value());
  return *build;
}

// Leaves a RUNNING and a PENDING build behind, as a crash would.
void SeedCrashedState(const std::shared_ptr<fwbuild::db::Repository>& repo, const fs::path& artifacts_root) {
  fwbuild::status::StatusStore store(repo);
  store.Hydrate();

  auto seed = [&](const std::string& id, const BuildRequest& request) {
    Build build;
    build.set_id(id);
    build.set_sequence(store.NextSequence());
    *build.mutable_request() = request;
    build.set_request_hash(id);
    build.set_state(BUILD_STATE_PENDING);
    *build.mutable_created_at() = fwbuild::util::NowProto();
    store.Insert(build);
  };

  seed("crashed-running", MakeRequest({"HAL_EXTERNAL_AHRS_ENABLED"}));
  seed("crashed-pending", MakeRequest());
  (void)store.Transition("crashed-running", BUILD_STATE_PENDING, BUILD_STATE_RUNNING, [](Build& b) { b.set_workspace_id(0); });

  fwbuild::artifacts::ArtifactStore artifacts(artifacts_root);
  artifacts.OpenLogWriter("crashed-running")->WriteLine("[12/900] Compiling half a firmware");
}

void TestCrashRecovery() {
  auto root    = MakeRoot("restart_crash");
  auto backing = std::make_shared<fwbuild::db::memory::MemoryRepository>();
  SeedCrashedState(backing, root / "artifacts");

  auto h = MakeHarness(root, HarnessOptions{.slots = 1, .max_in_flight = 4}, backing);
  h.orchestrator->Start();

  auto interrupted = h.orchestrator->Get("crashed-running");
  assert(interrupted.state() == BUILD_STATE_FAILURE);
  assert(interrupted.error().kind() == ERROR_KIND_INTERRUPTED);
  assert(!interrupted.has_workspace_id());
  assert(interrupted.has_finished_at());
  assert(interrupted.log_ref() == "crashed-running/build.log");
  assert(h.artifacts->IsSealed("crashed-running"));
  assert(h.orchestrator->GetLog("crashed-running").find("half a firmware") != std::string::npos);

  // queued work survives and runs
  auto resumed = WaitTerminal(*h.orchestrator, "crashed-pending");
  assert(resumed.state() == BUILD_STATE_SUCCESS);

  // sequences continue after the persisted maximum
  auto fresh = h.orchestrator->Submit(MakeRequest({"AP_SCRIPTING_ENABLED"}));
  assert(h.orchestrator->Get(fresh).sequence() == 3);
  assert(WaitTerminal(*h.orchestrator, fresh).state() == BUILD_STATE_SUCCESS);

  h.orchestrator->Stop();
  fs::remove_all(root);
}

void TestGracefulStopAndResume() {
  auto root    = MakeRoot("restart_graceful");
  auto backing = std::make_shared<fwbuild::db::memory::MemoryRepository>();

  std::string running;
  std::string queued;
  {
    auto h = MakeHarness(root, HarnessOptions{.slots = 1, .max_in_flight = 4}, backing);
    h.orchestrator->Start();

    running = h.orchestrator->Submit(MakeRequest({"SLOW_BUILD"}));
    queued  = h.orchestrator->Submit(MakeRequest({"HAL_EXTERNAL_AHRS_ENABLED"}));
    assert(WaitForProgress(*h.orchestrator, running));

    h.orchestrator->Stop();

    auto stopped = h.orchestrator->Get(running);
    assert(stopped.state() == BUILD_STATE_FAILURE);
    assert(stopped.error().kind() == ERROR_KIND_INTERRUPTED);
    assert(h.orchestrator->Get(queued).state() == BUILD_STATE_PENDING);

    // stop is idempotent
    h.orchestrator->Stop();
  }

  auto h = MakeHarness(root, HarnessOptions{.slots = 1, .max_in_flight = 4}, backing);
  h.orchestrator->Start();

  assert(h.orchestrator->Get(running).error().kind() == ERROR_KIND_INTERRUPTED);
  auto resumed = WaitTerminal(*h.orchestrator, queued);
  assert(resumed.state() == BUILD_STATE_SUCCESS);
  assert(!resumed.artifact_ref().empty());

  h.orchestrator->Stop();
  fs::remove_all(root);
}

} // namespace

int main() {
  TestCrashRecovery();
  TestGracefulStopAndResume();

  std::cout << "fwbuild_integration_orchestrator_restart: pass\n";
  return 0;
}
