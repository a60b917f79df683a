#include "internal/configurator/build_configurator.hpp"

#include <fstream>
#include <map>
#include <set>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace fwbuild::configurator {

using namespace fwbuild::v1;

namespace {

using FeatureIndex = std::map<std::string, const FeatureOption*>;

FeatureIndex IndexFeatures(const CatalogVersion& version) {
  FeatureIndex index;
  for (const auto& feature : version.features()) {
    index.emplace(feature.define(), &feature);
  }
  return index;
}

[[noreturn]] void Incompatible(const std::string& message) {
  throw util::ConfigError(ERROR_KIND_INCOMPATIBLE_FEATURES, message);
}

} // namespace

std::vector<std::string> BuildConfigurator::ResolveFeatures(const CatalogVersion&            version,
                                                            const std::vector<std::string>& selected) {
  const auto index = IndexFeatures(version);

  std::set<std::string>    enabled;
  std::vector<std::string> pending(selected.begin(), selected.end());

  while (!pending.empty()) {
    std::string define = std::move(pending.back());
    pending.pop_back();
    if (!enabled.insert(define).second) continue;

    auto it = index.find(define);
    if (it == index.end()) {
      Incompatible("feature " + define + " is not known at version " + version.id());
    }
    for (const auto& dependency : it->second->depends()) {
      if (!index.contains(dependency)) {
        Incompatible("feature " + define + " depends on unknown feature " + dependency);
      }
      pending.push_back(dependency);
    }
  }

  for (const auto& define : enabled) {
    for (const auto& other : index.at(define)->conflicts()) {
      if (enabled.contains(other)) {
        Incompatible("feature " + define + " conflicts with " + other);
      }
    }
  }

  return {enabled.begin(), enabled.end()};
}

/*
  undef <every define>
  define <enabled> 1
  define <remaining> 0

  Each block sorted by name.
*/
BuildConfig BuildConfigurator::Render(const CatalogVersion& version, const std::vector<std::string>& enabled) {
  std::set<std::string> all;
  for (const auto& feature : version.features()) {
    all.insert(feature.define());
  }
  std::set<std::string> on(enabled.begin(), enabled.end());

  BuildConfig config;
  for (const auto& define : all) {
    config.rendered += "undef " + define + "\n";
  }
  for (const auto& define : all) {
    if (!on.contains(define)) continue;
    config.enabled.push_back(define);
    config.rendered += "define " + define + " 1\n";
  }
  for (const auto& define : all) {
    if (on.contains(define)) continue;
    config.disabled.push_back(define);
    config.rendered += "define " + define + " 0\n";
  }

  config.digest = util::ToHex(util::Fnv1a64(config.rendered));
  return config;
}

BuildConfig BuildConfigurator::Materialize(const std::filesystem::path& config_path, const CatalogVersion& version,
                                           const BuildRequest& request) const {
  std::vector<std::string> selected(request.features().begin(), request.features().end());

  auto config = Render(version, ResolveFeatures(version, selected));
  config.path = config_path;

  auto tmp = config_path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(config.rendered.data(), static_cast<std::streamsize>(config.rendered.size()));
    out.flush();
    if (!out) throw std::runtime_error("cannot write " + tmp.string());
  }
  std::filesystem::rename(tmp, config_path);

  return config;
}

} // namespace fwbuild::configurator
