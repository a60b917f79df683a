#include "internal/process/child_process.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

namespace {

using fwbuild::process::CancelReason;
using fwbuild::process::CancelToken;
using fwbuild::process::ProcessSpec;
using fwbuild::process::RunProcess;

ProcessSpec Shell(const std::string& script) {
  ProcessSpec spec;
  spec.argv = {"/bin/sh", "-c", script};
  return spec;
}

void TestOutputIsMergedAndExitCodeReported() {
  std::string output;
  auto        result = RunProcess(Shell("echo out; echo err 1>&2; exit 3"), [&](std::string_view bytes) { output.append(bytes); });

  assert(!result.Succeeded());
  assert(result.exit_code == 3);
  assert(result.cancelled == CancelReason::kNone);
  assert(output.find("out\n") != std::string::npos);
  assert(output.find("err\n") != std::string::npos);
}

void TestEnvironmentAndWorkingDirectory() {
  auto spec        = Shell("printf '%s|' \"$FWBUILD_TEST_VALUE\"; pwd -P");
  spec.env         = {{"FWBUILD_TEST_VALUE", "hello world"}};
  spec.working_dir = std::filesystem::temp_directory_path().string();

  std::string output;
  auto        result = RunProcess(spec, [&](std::string_view bytes) { output.append(bytes); });

  assert(result.Succeeded());
  assert(output.rfind("hello world|", 0) == 0);
  assert(output.find(std::filesystem::canonical(spec.working_dir).string()) != std::string::npos);
}

void TestMissingBinaryExits127() {
  ProcessSpec spec;
  spec.argv = {"fwbuild-no-such-binary-on-path"};

  auto result = RunProcess(spec, nullptr);
  assert(result.exit_code == 127);
}

void TestEmptyArgvThrows() {
  bool threw = false;
  try {
    (void)RunProcess(ProcessSpec{}, nullptr);
  } catch (const std::system_error&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelTerminatesProcessGroup() {
  CancelToken token;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    token.Cancel(CancelReason::kUser);
  });

  const auto start  = std::chrono::steady_clock::now();
  auto       result = RunProcess(Shell("sleep 30 & sleep 30; wait"), nullptr, &token, std::chrono::seconds(2));
  const auto took   = std::chrono::steady_clock::now() - start;
  canceller.join();

  assert(result.cancelled == CancelReason::kUser);
  assert(!result.Succeeded());
  assert(took < std::chrono::seconds(10));
}

void TestIgnoredTermIsKilledAfterGrace() {
  CancelToken token;
  token.Cancel(CancelReason::kShutdown);

  const auto start  = std::chrono::steady_clock::now();
  auto       result = RunProcess(Shell("trap '' TERM; sleep 30"), nullptr, &token, std::chrono::milliseconds(300));
  const auto took   = std::chrono::steady_clock::now() - start;

  assert(result.cancelled == CancelReason::kShutdown);
  assert(took < std::chrono::seconds(10));
}

void TestDeadlineReadsAsTimeout() {
  CancelToken token(CancelToken::Clock::now() + std::chrono::milliseconds(200));

  auto result = RunProcess(Shell("sleep 30"), nullptr, &token, std::chrono::milliseconds(500));
  assert(result.cancelled == CancelReason::kTimeout);

  // first reason wins
  token.Cancel(CancelReason::kUser);
  assert(token.Reason() == CancelReason::kTimeout);
}

void TestExitSeenWhileGrandchildHoldsOutput() {
  for (bool with_token : {false, true}) {
    CancelToken token;
    const auto  start  = std::chrono::steady_clock::now();
    auto        result = RunProcess(Shell("sleep 2 & exit 3"), nullptr, with_token ? &token : nullptr);
    const auto  took   = std::chrono::steady_clock::now() - start;

    assert(result.exit_code == 3);
    assert(result.cancelled == CancelReason::kNone);
    assert(took < std::chrono::milliseconds(1500));
  }
}

void TestExitSeenAfterOutputCloses() {
  const auto start  = std::chrono::steady_clock::now();
  auto       result = RunProcess(Shell("exec 1>&- 2>&-; sleep 0.3; exit 4"), nullptr);
  const auto took   = std::chrono::steady_clock::now() - start;

  assert(result.exit_code == 4);
  assert(took >= std::chrono::milliseconds(300));
  assert(took < std::chrono::seconds(2));
}

void TestQuoteCommand() {
  assert(fwbuild::process::QuoteCommand({"./waf", "configure", "--board", "SPEDIXF405"}) == "./waf configure --board SPEDIXF405");
  assert(fwbuild::process::QuoteCommand({"sh", "-c", "echo hi"}) == "sh -c 'echo hi'");
}

} // namespace

int main() {
  TestOutputIsMergedAndExitCodeReported();
  TestEnvironmentAndWorkingDirectory();
  TestMissingBinaryExits127();
  TestEmptyArgvThrows();
  TestCancelTerminatesProcessGroup();
  TestIgnoredTermIsKilledAfterGrace();
  TestDeadlineReadsAsTimeout();
  TestExitSeenWhileGrandchildHoldsOutput();
  TestExitSeenAfterOutputCloses();
  TestQuoteCommand();

  std::cout << "fwbuild_unit_child_process: pass\n";
  return 0;
}
