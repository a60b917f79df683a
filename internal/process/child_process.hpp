#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/process/cancel_token.hpp"

namespace fwbuild::process {

struct ProcessSpec {
  std::vector<std::string> argv;
  // empty: inherit the current directory
  std::string working_dir;
  // overrides applied on top of the current environment
  std::map<std::string, std::string> env;
};

struct ProcessResult {
  int          exit_code   = -1;
  int          term_signal = 0;
  CancelReason cancelled   = CancelReason::kNone;

  bool Succeeded() const {
    return cancelled == CancelReason::kNone && term_signal == 0 && exit_code == 0;
  }
};

// Receives merged stdout/stderr as it arrives.
using OutputSink = std::function<void(std::string_view)>;

/*
  Runs argv[0] (PATH lookup uses the overridden environment) in its own
  process group with stdout and stderr merged into one pipe.

  When the token is cancelled the group receives SIGTERM, then SIGKILL once
  `grace` has elapsed. Returns once the child has been reaped, even while a
  background grandchild still holds the output pipe open.

  Throws std::system_error when the process cannot be started.
*/
ProcessResult RunProcess(const ProcessSpec& spec, const OutputSink& sink, const CancelToken* token = nullptr,
                         std::chrono::milliseconds grace = std::chrono::seconds(10));

// Joins argv for logs, quoting arguments that contain whitespace.
std::string QuoteCommand(const std::vector<std::string>& argv);

} // namespace fwbuild::process
