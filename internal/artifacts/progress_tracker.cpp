#include "internal/artifacts/progress_tracker.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace fwbuild::artifacts {
namespace {

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Parses "[<non-digits>N<non-digits>/<non-digits>M<non-digits>]" starting at open.
std::optional<std::pair<int, int>> ParseMarker(std::string_view s, size_t open, size_t close) {
  auto inner = s.substr(open + 1, close - open - 1);
  auto slash = inner.find('/');
  if (slash == std::string_view::npos || inner.find('/', slash + 1) != std::string_view::npos) return std::nullopt;

  auto number = [](std::string_view part) -> std::optional<int> {
    auto first = std::find_if(part.begin(), part.end(), IsDigit);
    if (first == part.end()) return std::nullopt;
    auto last = std::find_if_not(first, part.end(), IsDigit);
    // exactly one run of digits
    if (std::find_if(last, part.end(), IsDigit) != part.end()) return std::nullopt;
    if (last - first > 9) return std::nullopt;
    return std::stoi(std::string(first, last));
  };

  auto done  = number(inner.substr(0, slash));
  auto total = number(inner.substr(slash + 1));
  if (!done || !total) return std::nullopt;
  return std::make_pair(*done, *total);
}

} // namespace

std::optional<std::pair<int, int>> LastStepMarker(std::string_view log) {
  size_t end = log.size();
  while (end > 0) {
    auto close = log.rfind(']', end - 1);
    if (close == std::string_view::npos) return std::nullopt;
    auto open = log.rfind('[', close);
    if (open == std::string_view::npos) return std::nullopt;
    if (auto marker = ParseMarker(log, open, close)) return marker;
    end = close;
  }
  return std::nullopt;
}

int ProgressPercent(std::string_view log) {
  auto marker = LastStepMarker(log);
  if (!marker) return 0;

  // counts reach nine digits; the weighted products need 64 bits
  const int64_t total = marker->second;
  if (total <= 0) return 0;
  const int64_t done = std::clamp<int64_t>(marker->first, 0, total);

  if (total < 20) return 1;
  if (total < 200) return static_cast<int>(done * 4 / total) + 1;
  return static_cast<int>(done * 95 / total) + 5;
}

} // namespace fwbuild::artifacts
