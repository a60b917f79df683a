#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "internal/workspace/source_control.hpp"

namespace fwbuild::workspace {

/*
  git CLI driven through child processes.

    clone     git clone --no-checkout <mirror> <dir>
    checkout  fetch from mirror, rev-parse <ref>^{commit},
              checkout --force --detach, reset --hard, clean -xdff,
              [submodule update --init --recursive --force]

  A cancelled token stops the running git command within cancel_grace.
*/
class GitSourceControl final : public SourceControl {
 public:
  GitSourceControl(std::string mirror_path, std::string git_binary = "git", bool update_submodules = false,
                   std::chrono::milliseconds cancel_grace = std::chrono::seconds(10));

  void Clone(const std::filesystem::path& dir, const process::OutputSink& log,
             const process::CancelToken* token) override;

  std::string Checkout(const std::filesystem::path& dir, const std::string& ref, const process::OutputSink& log,
                       const process::CancelToken* token) override;

  bool IsHealthy(const std::filesystem::path& dir) override;

 private:
  // Throws process::Cancelled when token fires before git exits.
  process::ProcessResult Git(const std::filesystem::path& dir, const std::vector<std::string>& args,
                             const process::OutputSink& log, const process::CancelToken* token) const;

  // Runs git and throws CheckoutError (GIT_FAILURE, or CORRUPT_WORKSPACE
  // when the repository itself turns out to be broken) on non-zero exit.
  void GitOrThrow(const std::filesystem::path& dir, const std::vector<std::string>& args,
                  const process::OutputSink& log, const process::CancelToken* token);

  std::optional<std::string> Resolve(const std::filesystem::path& dir, const std::string& ref,
                                     const process::CancelToken* token) const;

  std::string mirror_path_;
  std::string git_binary_;
  bool        update_submodules_;

  std::chrono::milliseconds cancel_grace_;
};

} // namespace fwbuild::workspace
