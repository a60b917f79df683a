#include "internal/toolchain/toolchain_runner.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <system_error>

#include "internal/artifacts/artifact_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/child_process.hpp"

namespace fwbuild::toolchain {

namespace fs = std::filesystem;
using fwbuild::observability::IntField;
using fwbuild::observability::StringField;

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ToolchainRunner::ToolchainRunner(fwbuild::runtime::config::ToolchainConfig config, std::chrono::milliseconds cancel_grace)
    : config_(std::move(config)), cancel_grace_(cancel_grace) {
}

std::string ToolchainRunner::Expand(const std::string& value, const ToolchainContext& context) {
  const std::map<std::string, std::string> vars = {
      {"build_id", context.build_id},
      {"vehicle", context.vehicle},
      {"board", context.board},
      {"commit", context.commit},
      {"workspace", context.workspace.string()},
      {"source_dir", context.source_dir.string()},
      {"out_dir", context.out_dir.string()},
      {"config_path", context.config_path.string()},
  };

  std::string out;
  out.reserve(value.size());
  std::size_t pos = 0;
  while (pos < value.size()) {
    auto open = value.find('{', pos);
    if (open == std::string::npos) break;
    auto close = value.find('}', open);
    if (close == std::string::npos) break;

    out.append(value, pos, open - pos);
    auto it = vars.find(value.substr(open + 1, close - open - 1));
    if (it != vars.end()) {
      out += it->second;
    } else {
      out.append(value, open, close - open + 1);
    }
    pos = close + 1;
  }
  out.append(value, pos, std::string::npos);
  return out;
}

ToolchainOutcome ToolchainRunner::Run(const ToolchainContext& context, artifacts::LogWriter& log,
                                      const process::CancelToken& token) const {
  process::ProcessSpec base;
  base.working_dir = context.source_dir.string();

  std::string path;
  for (const auto& entry : config_.path_prepend()) {
    if (!path.empty()) path += ':';
    path += Expand(entry, context);
  }
  if (!path.empty()) {
    const char* inherited = std::getenv("PATH");
    base.env["PATH"]      = inherited ? path + ":" + inherited : path;
  }
  for (const auto& [key, value] : config_.env()) {
    base.env[key] = Expand(value, context);
  }

  ToolchainOutcome outcome;
  for (const auto& step : config_.steps()) {
    auto spec = base;
    for (const auto& arg : step.argv()) {
      spec.argv.push_back(Expand(arg, context));
    }

    log.WriteLine("==> " + step.name() + ": " + process::QuoteCommand(spec.argv));
    FWBUILD_LOG_INFO("toolchain step started", {StringField("build_id", context.build_id), StringField("step", step.name())});

    auto result = process::RunProcess(spec, [&](std::string_view bytes) { log.Write(bytes); }, &token, cancel_grace_);

    FWBUILD_LOG_INFO("toolchain step exited", {StringField("build_id", context.build_id), StringField("step", step.name()),
                                               IntField("exit_code", result.exit_code)});

    if (result.cancelled != process::CancelReason::kNone) {
      log.WriteLine("==> " + step.name() + " cancelled");
      outcome.cancelled   = result.cancelled;
      outcome.exit_code   = result.exit_code;
      outcome.failed_step = step.name();
      return outcome;
    }
    if (!result.Succeeded()) {
      log.WriteLine("==> " + step.name() + " exited with " + std::to_string(result.exit_code));
      outcome.exit_code   = result.exit_code;
      outcome.failed_step = step.name();
      return outcome;
    }
  }

  outcome.succeeded = true;
  return outcome;
}

std::vector<fs::path> ToolchainRunner::CollectArtifacts(const ToolchainContext& context) const {
  fs::path dir = config_.artifact_dir().empty() ? context.out_dir : fs::path(Expand(config_.artifact_dir(), context));

  std::vector<fs::path> found;
  std::error_code       ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    auto name = it->path().filename().string();
    if (config_.artifact_suffixes().empty()) {
      found.push_back(it->path());
      continue;
    }
    for (const auto& suffix : config_.artifact_suffixes()) {
      if (EndsWith(name, suffix)) {
        found.push_back(it->path());
        break;
      }
    }
  }
  std::sort(found.begin(), found.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename().string() < b.filename().string(); });
  return found;
}

} // namespace fwbuild::toolchain
