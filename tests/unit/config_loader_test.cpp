#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fwbuild_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

constexpr const char* kComplete = R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/fwbuild/status.db"
    synchronous_full: true
workspaces:
  root: /var/lib/fwbuild/workspaces
  mirror_path: /var/lib/fwbuild/ardupilot.git
  count: 2
  update_submodules: true
queue:
  max_in_flight: 8
  build_timeout: "1800s"
  cancel_grace: "10s"
  deduplicate: true
toolchain:
  steps:
    - name: configure
      argv: ["./waf", "configure", "--board", "{board}", "--extra-hwdef", "{config_path}"]
    - name: build
      argv: ["./waf", "{vehicle}"]
  artifact_dir: "{source_dir}/build/{board}/bin"
  artifact_suffixes: [".apj", ".hex"]
  path_prepend: ["/opt/gcc-arm-none-eabi/bin"]
  env:
    CCACHE_DIR: /var/cache/ccache
artifacts:
  root: /var/lib/fwbuild/artifacts
catalog:
  path: /var/lib/fwbuild/catalog.yaml
)";

void TestCompleteConfigLoadsAndValidates() {
  auto config = fwbuild::config::ConfigLoader::LoadFromYaml(WriteYaml("complete", kComplete).string());

  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/fwbuild/status.db");
  assert(config.workspaces().count() == 2);
  assert(config.workspaces().update_submodules());
  assert(config.queue().max_in_flight() == 8);
  assert(config.queue().build_timeout().seconds() == 1800);
  assert(config.queue().deduplicate());
  assert(config.toolchain().steps_size() == 2);
  assert(config.toolchain().steps(0).argv(3) == "{board}");
  assert(config.toolchain().artifact_suffixes_size() == 2);
  assert(config.toolchain().env().at("CCACHE_DIR") == "/var/cache/ccache");

  fwbuild::config::ConfigLoader::Validate(config);
}

void TestQuotedScalarsStayStrings() {
  auto config = fwbuild::config::ConfigLoader::LoadFromYaml(WriteYaml("quoted", R"(database:
  sqlite:
    path: "C:\\fwbuild\\\"quoted\"\\db.sqlite"
toolchain:
  steps:
    - name: "1234"
      argv: ["true"]
)")
                                                                .string());
  assert(config.database().sqlite().path() == "C:\\fwbuild\\\"quoted\"\\db.sqlite");
  assert(config.toolchain().steps(0).name() == "1234");
  assert(config.toolchain().steps(0).argv(0) == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(workspaces:
  root: /tmp/ws
  slots: 4
)");

  bool threw = false;
  try {
    (void)fwbuild::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingRequiredParametersAreNamed() {
  auto config = fwbuild::config::ConfigLoader::LoadFromYaml(WriteYaml("missing_timeout", kComplete).string());
  config.mutable_queue()->clear_build_timeout();

  std::string message;
  try {
    fwbuild::config::ConfigLoader::Validate(config);
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  assert(message.find("queue.build_timeout") != std::string::npos);

  config = fwbuild::config::ConfigLoader::LoadFromYaml(WriteYaml("missing_steps", kComplete).string());
  config.mutable_toolchain()->clear_steps();
  message.clear();
  try {
    fwbuild::config::ConfigLoader::Validate(config);
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  assert(message.find("toolchain.steps") != std::string::npos);

  config = fwbuild::config::ConfigLoader::LoadFromYaml(WriteYaml("zero_slots", kComplete).string());
  config.mutable_workspaces()->set_count(0);
  message.clear();
  try {
    fwbuild::config::ConfigLoader::Validate(config);
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  assert(message.find("workspaces.count") != std::string::npos);
}

} // namespace

int main() {
  TestCompleteConfigLoadsAndValidates();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingRequiredParametersAreNamed();

  std::cout << "fwbuild_unit_config_loader: pass\n";
  return 0;
}
