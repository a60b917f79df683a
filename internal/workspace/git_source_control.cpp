#include "internal/workspace/git_source_control.hpp"

#include <optional>
#include <system_error>

#include "internal/util/errors.hpp"

namespace fwbuild::workspace {

namespace fs = std::filesystem;
using fwbuild::v1::ErrorKind;

namespace {

std::string Trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

} // namespace

GitSourceControl::GitSourceControl(std::string mirror_path, std::string git_binary, bool update_submodules,
                                   std::chrono::milliseconds cancel_grace)
    : mirror_path_(std::move(mirror_path)),
      git_binary_(git_binary.empty() ? "git" : std::move(git_binary)),
      update_submodules_(update_submodules),
      cancel_grace_(cancel_grace) {
}

process::ProcessResult GitSourceControl::Git(const fs::path& dir, const std::vector<std::string>& args,
                                             const process::OutputSink& log, const process::CancelToken* token) const {
  process::ProcessSpec spec;
  spec.argv.push_back(git_binary_);
  if (!dir.empty()) {
    spec.argv.push_back("-C");
    spec.argv.push_back(dir.string());
  }
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.env["GIT_TERMINAL_PROMPT"] = "0";

  if (log) log("$ " + process::QuoteCommand(spec.argv) + "\n");
  process::ProcessResult result;
  try {
    result = process::RunProcess(spec, log, token, cancel_grace_);
  } catch (const std::system_error& e) {
    throw util::CheckoutError(ErrorKind::ERROR_KIND_GIT_FAILURE, std::string("cannot run git: ") + e.what());
  }
  if (result.cancelled != process::CancelReason::kNone) {
    throw process::Cancelled(result.cancelled, "git " + args.front() + " cancelled");
  }
  return result;
}

void GitSourceControl::GitOrThrow(const fs::path& dir, const std::vector<std::string>& args,
                                  const process::OutputSink& log, const process::CancelToken* token) {
  auto result = Git(dir, args, log, token);
  if (result.Succeeded()) return;

  std::string what = "git " + args.front() + " exited with " + std::to_string(result.exit_code);
  if (!IsHealthy(dir)) {
    throw util::CheckoutError(ErrorKind::ERROR_KIND_CORRUPT_WORKSPACE, what + " (repository is broken)");
  }
  throw util::CheckoutError(ErrorKind::ERROR_KIND_GIT_FAILURE, what);
}

void GitSourceControl::Clone(const fs::path& dir, const process::OutputSink& log, const process::CancelToken* token) {
  auto result = Git({}, {"clone", "--no-checkout", mirror_path_, dir.string()}, log, token);
  if (!result.Succeeded()) {
    throw util::CheckoutError(ErrorKind::ERROR_KIND_GIT_FAILURE,
                              "git clone of " + mirror_path_ + " exited with " + std::to_string(result.exit_code));
  }
}

bool GitSourceControl::IsHealthy(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir / ".git", ec)) return false;
  return Git(dir, {"rev-parse", "--git-dir"}, nullptr, nullptr).Succeeded();
}

std::optional<std::string> GitSourceControl::Resolve(const fs::path& dir, const std::string& ref,
                                                     const process::CancelToken* token) const {
  for (const auto& candidate : {ref, "origin/" + ref}) {
    std::string out;
    auto        result =
        Git(dir, {"rev-parse", "--verify", "--quiet", candidate + "^{commit}"}, [&](std::string_view s) { out += s; }, token);
    if (result.Succeeded()) return Trim(out);
  }
  return std::nullopt;
}

std::string GitSourceControl::Checkout(const fs::path& dir, const std::string& ref, const process::OutputSink& log,
                                      const process::CancelToken* token) {
  if (!IsHealthy(dir)) {
    throw util::CheckoutError(ErrorKind::ERROR_KIND_CORRUPT_WORKSPACE, dir.string() + " is not a git repository");
  }

  GitOrThrow(dir,
             {"fetch", "--force", "--tags", "origin", "+refs/heads/*:refs/remotes/origin/*",
              "+refs/tags/*:refs/tags/*"},
             log, token);

  auto commit = Resolve(dir, ref, token);
  if (!commit) {
    throw util::CheckoutError(ErrorKind::ERROR_KIND_UNRESOLVABLE_REF, "ref " + ref + " does not name a commit");
  }

  GitOrThrow(dir, {"checkout", "--force", "--detach", *commit}, log, token);
  GitOrThrow(dir, {"reset", "--hard", *commit}, log, token);
  GitOrThrow(dir, {"clean", "-xdff"}, log, token);
  if (update_submodules_) {
    GitOrThrow(dir, {"submodule", "update", "--init", "--recursive", "--force"}, log, token);
  }
  return *commit;
}

} // namespace fwbuild::workspace
