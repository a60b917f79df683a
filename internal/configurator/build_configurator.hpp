#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "fwbuild/v1.hpp"

namespace fwbuild::configurator {

/*
  Configuration artifact consumed by the toolchain.

  `rendered` is the exact file content; identical inputs always yield
  identical bytes and therefore identical digests.
*/
struct BuildConfig {
  std::vector<std::string> enabled;  // sorted
  std::vector<std::string> disabled; // sorted
  std::string              rendered;
  std::string              digest; // FNV-1a 64 of rendered, hex
  std::filesystem::path    path;
};

class BuildConfigurator {
 public:
  /*
    Selected features plus everything they depend on, transitively, sorted.

    Throws util::ConfigError{INCOMPATIBLE_FEATURES} when an enabled feature
    conflicts with another enabled feature, or when a selected feature or
    dependency is unknown at this version.
  */
  static std::vector<std::string> ResolveFeatures(const fwbuild::v1::CatalogVersion& version,
                                                  const std::vector<std::string>&    selected);

  // Pure; no filesystem access.
  static BuildConfig Render(const fwbuild::v1::CatalogVersion& version, const std::vector<std::string>& enabled);

  // Resolve + Render, then write the file atomically to config_path.
  BuildConfig Materialize(const std::filesystem::path& config_path, const fwbuild::v1::CatalogVersion& version,
                          const fwbuild::v1::BuildRequest& request) const;
};

} // namespace fwbuild::configurator
