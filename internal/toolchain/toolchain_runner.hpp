#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/process/cancel_token.hpp"

namespace fwbuild::artifacts {
class LogWriter;
}

namespace fwbuild::toolchain {

// Values substituted into step argv, env values and artifact_dir.
struct ToolchainContext {
  std::string           build_id;
  std::string           vehicle;
  std::string           board;
  std::string           commit;
  std::filesystem::path workspace;
  std::filesystem::path source_dir;
  std::filesystem::path out_dir;
  std::filesystem::path config_path;
};

struct ToolchainOutcome {
  bool                  succeeded = false;
  int                   exit_code = 0;
  std::string           failed_step;
  process::CancelReason cancelled = process::CancelReason::kNone;
};

/*
  Runs the configured steps in order inside the source directory, piping
  merged output into the build log. Stops at the first step that fails or
  is cancelled.
*/
class ToolchainRunner {
 public:
  ToolchainRunner(fwbuild::runtime::config::ToolchainConfig config, std::chrono::milliseconds cancel_grace);

  ToolchainOutcome Run(const ToolchainContext& context, artifacts::LogWriter& log,
                       const process::CancelToken& token) const;

  // Regular files in the expanded artifact_dir (default: out_dir) ending in
  // one of the configured suffixes, or all of them when none are configured.
  // Sorted by file name.
  std::vector<std::filesystem::path> CollectArtifacts(const ToolchainContext& context) const;

  // Replaces {build_id} {vehicle} {board} {commit} {workspace} {source_dir}
  // {out_dir} {config_path}. Unknown placeholders are left as they are.
  static std::string Expand(const std::string& value, const ToolchainContext& context);

 private:
  fwbuild::runtime::config::ToolchainConfig config_;
  std::chrono::milliseconds                 cancel_grace_;
};

} // namespace fwbuild::toolchain
