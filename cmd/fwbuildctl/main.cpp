#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/build_orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/model/build_request.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_store.hpp"
#include "internal/util/errors.hpp"

using namespace fwbuild::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fwbuildctl <config.yaml> run <vehicle> <board> <version_id> [feature...]\n"
            << "  fwbuildctl <config.yaml> get <build_id>\n"
            << "  fwbuildctl <config.yaml> list [PENDING|RUNNING|SUCCESS|FAILURE|CANCELLED] [limit]\n"
            << "  fwbuildctl <config.yaml> log <build_id> [tail_lines]\n"
            << "  fwbuildctl <config.yaml> artifact <build_id> <out_path>\n"
            << "  fwbuildctl <config.yaml> prune <build_id>\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return out;
}

static void PrintSummary(const Build& build) {
  std::cout << build.id() << "  " << BuildState_Name(build.state()) << "  " << build.request().vehicle() << "/"
            << build.request().board() << "@" << build.request().version_id();
  if (build.state() == BUILD_STATE_RUNNING) std::cout << "  " << build.progress_percent() << "%";
  if (build.state() == BUILD_STATE_FAILURE) {
    std::cout << "  " << fwbuild::model::ErrorKindName(build.error().kind()) << ": " << build.error().message();
  }
  std::cout << "\n";
}

// Submits one build to an embedded orchestrator and waits for it.
static int RunBuild(fwbuild::factory::Application& app, int argc, char** argv) {
  if (argc < 6) {
    Usage();
    return 1;
  }

  BuildRequest request;
  request.set_vehicle(argv[3]);
  request.set_board(argv[4]);
  request.set_version_id(argv[5]);
  for (int i = 6; i < argc; ++i) request.add_features(argv[i]);

  app.orchestrator->Start();

  std::string id;
  try {
    id = app.orchestrator->Submit(request);
  } catch (const fwbuild::util::AdmissionError& e) {
    std::cerr << fwbuild::model::ErrorKindName(e.Kind()) << ": " << e.what() << "\n";
    app.orchestrator->Stop();
    return 3;
  }
  std::cout << id << "\n";

  std::optional<Build> build;
  while (!build || build->state() == BUILD_STATE_PENDING || build->state() == BUILD_STATE_RUNNING) {
    if (app.orchestrator->Failed()) break;
    build = app.orchestrator->WaitForTerminal(id, std::chrono::seconds(5));
    if (build && build->state() == BUILD_STATE_RUNNING) {
      std::cerr << "progress: " << app.orchestrator->Get(id).progress_percent() << "%\n";
    }
  }
  app.orchestrator->Stop();

  if (app.orchestrator->Failed()) {
    std::cerr << "status store failed: " << app.orchestrator->FailureReason() << "\n";
    return 2;
  }

  PrintSummary(*build);
  return build->state() == BUILD_STATE_SUCCESS ? 0 : 3;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = fwbuild::config::ConfigLoader::LoadFromYaml(config_path);
    fwbuild::observability::InitializeLogging(config);

    auto app = fwbuild::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "run") {
      int rc = RunBuild(app, argc, argv);
      fwbuild::observability::ShutdownLogging();
      return rc;
    }

    // Read-side commands never start workers.
    app.status->Hydrate();

    if (cmd == "get") {
      if (argc < 4) return 1;
      std::cout << ToJson(app.orchestrator->Get(argv[3])) << "\n";
    } else if (cmd == "list") {
      BuildFilter filter;
      if (argc >= 4) {
        auto state = fwbuild::model::ParseState(argv[3]);
        if (!state.has_value()) {
          std::cerr << "unknown state: " << argv[3] << "\n";
          return 1;
        }
        filter.set_state(*state);
      }
      if (argc >= 5) filter.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));
      for (const auto& build : app.orchestrator->List(filter)) PrintSummary(build);
    } else if (cmd == "log") {
      if (argc < 4) return 1;
      std::size_t tail = argc >= 5 ? std::stoul(argv[4]) : 0;
      std::cout << app.orchestrator->GetLog(argv[3], tail);
    } else if (cmd == "artifact") {
      if (argc < 5) return 1;
      auto          bytes = app.orchestrator->GetArtifact(argv[3]);
      std::ofstream out(argv[4], std::ios::binary | std::ios::trunc);
      if (!out) {
        std::cerr << "cannot open " << argv[4] << "\n";
        return 2;
      }
      out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
      std::cout << bytes.size() << " bytes written to " << argv[4] << "\n";
    } else if (cmd == "prune") {
      if (argc < 4) return 1;
      app.orchestrator->Prune(argv[3]);
      std::cout << "pruned " << argv[3] << "\n";
    } else {
      Usage();
      return 1;
    }
  } catch (const fwbuild::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 4;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  fwbuild::observability::ShutdownLogging();
  return 0;
}
