#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fwbuild::artifacts {

inline void ValidateBuildId(const std::string& build_id) {
  if (build_id.empty()) {
    throw std::invalid_argument("build id must not be empty");
  }
  for (char c : build_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("build id contains invalid character");
    }
  }
  if (build_id == "." || build_id == "..") {
    throw std::invalid_argument("build id must not be a relative path component");
  }
}

inline std::filesystem::path BuildDir(const std::filesystem::path& root, const std::string& build_id) {
  ValidateBuildId(build_id);
  return root / build_id;
}

} // namespace fwbuild::artifacts
