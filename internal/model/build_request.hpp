#pragma once

#include <optional>
#include <string>

#include "fwbuild/v1.hpp"

namespace fwbuild::model {

// Sorted, de-duplicated features; surrounding whitespace trimmed from all ids.
fwbuild::v1::BuildRequest Normalize(const fwbuild::v1::BuildRequest& request);

// Content hash of the normalized request. Identical requests share a hash.
std::string RequestHash(const fwbuild::v1::BuildRequest& normalized);

std::string ErrorKindName(fwbuild::v1::ErrorKind kind);

std::optional<fwbuild::v1::BuildState> ParseState(const std::string& name);

} // namespace fwbuild::model
