#pragma once

#include <optional>
#include <string_view>
#include <utility>

namespace fwbuild::artifacts {

// Last "[N/M]" step marker in the log, if any.
std::optional<std::pair<int, int>> LastStepMarker(std::string_view log);

/*
  Percent complete of a RUNNING build estimated from its log.

  Small step counts belong to the configure and library phases and weigh
  little; the firmware compile itself (hundreds of steps) carries 95%.
*/
int ProgressPercent(std::string_view log);

} // namespace fwbuild::artifacts
