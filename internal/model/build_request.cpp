#include "build_request.hpp"

#include <algorithm>
#include <set>

#include "internal/model/state_machine.hpp"
#include "internal/util/hash.hpp"

namespace fwbuild::model {

using namespace fwbuild::v1;

namespace {

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace

BuildRequest Normalize(const BuildRequest& request) {
  BuildRequest normalized;
  normalized.set_vehicle(Trim(request.vehicle()));
  normalized.set_board(Trim(request.board()));
  normalized.set_version_id(Trim(request.version_id()));

  std::set<std::string> features;
  for (const auto& feature : request.features()) {
    auto trimmed = Trim(feature);
    if (!trimmed.empty()) features.insert(std::move(trimmed));
  }
  for (const auto& feature : features) {
    normalized.add_features(feature);
  }
  return normalized;
}

std::string RequestHash(const BuildRequest& normalized) {
  // field separator 0x1f cannot appear in a trimmed id coming from the catalog
  std::string canonical;
  canonical += normalized.vehicle();
  canonical += '\x1f';
  canonical += normalized.board();
  canonical += '\x1f';
  canonical += normalized.version_id();
  for (const auto& feature : normalized.features()) {
    canonical += '\x1f';
    canonical += feature;
  }
  return util::ToHex(util::Fnv1a64(canonical));
}

const char* StateName(BuildState state) {
  switch (state) {
    case BUILD_STATE_PENDING:
      return "PENDING";
    case BUILD_STATE_RUNNING:
      return "RUNNING";
    case BUILD_STATE_SUCCESS:
      return "SUCCESS";
    case BUILD_STATE_FAILURE:
      return "FAILURE";
    case BUILD_STATE_CANCELLED:
      return "CANCELLED";
    default:
      return "UNSPECIFIED";
  }
}

std::optional<BuildState> ParseState(const std::string& name) {
  for (auto state : {BUILD_STATE_PENDING, BUILD_STATE_RUNNING, BUILD_STATE_SUCCESS, BUILD_STATE_FAILURE, BUILD_STATE_CANCELLED}) {
    if (name == StateName(state)) return state;
  }
  return std::nullopt;
}

std::string ErrorKindName(ErrorKind kind) {
  const auto& name = ErrorKind_Name(kind);
  static constexpr std::string_view kPrefix = "ERROR_KIND_";
  if (name.rfind(kPrefix, 0) == 0) return name.substr(kPrefix.size());
  return name;
}

} // namespace fwbuild::model
