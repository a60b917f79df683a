#include "internal/catalog/file_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <system_error>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fwbuild::catalog {

using namespace fwbuild::v1;

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

} // namespace

std::optional<CatalogVersion> FindVersion(const Catalog& catalog, const std::string& vehicle,
                                          const std::string& version_id, const std::string& board) {
  for (const auto& v : catalog.vehicles()) {
    if (!EqualsIgnoreCase(v.name(), vehicle)) continue;

    for (const auto& version : v.versions()) {
      if (version.id() != version_id) continue;
      const auto& boards = version.boards();
      if (std::find(boards.begin(), boards.end(), board) == boards.end()) return std::nullopt;
      return version;
    }
    return std::nullopt;
  }
  return std::nullopt;
}

FileCatalog::FileCatalog(std::filesystem::path path) : path_(std::move(path)) {
}

std::shared_ptr<const Catalog> FileCatalog::Current() {
  std::error_code ec;
  auto            mtime = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    throw util::CatalogUnavailable("catalog " + path_.string() + ": " + ec.message());
  }

  {
    std::shared_lock lock(mutex_);
    if (catalog_ && mtime == loaded_mtime_) return catalog_;
  }

  std::unique_lock lock(mutex_);
  if (catalog_ && mtime == loaded_mtime_) return catalog_;

  auto fresh = std::make_shared<Catalog>();
  try {
    config::ConfigLoader::LoadMessageFromYaml(path_.string(), fresh.get());
  } catch (const std::exception& e) {
    catalog_.reset();
    throw util::CatalogUnavailable("catalog " + path_.string() + ": " + e.what());
  }

  FWBUILD_LOG_INFO("catalog loaded", {observability::StringField("path", path_.string()),
                                      observability::IntField("vehicles", fresh->vehicles_size())});
  catalog_      = std::move(fresh);
  loaded_mtime_ = mtime;
  return catalog_;
}

std::optional<CatalogVersion> FileCatalog::Lookup(const std::string& vehicle, const std::string& version_id,
                                                  const std::string& board) {
  auto catalog = Current();
  return FindVersion(*catalog, vehicle, version_id, board);
}

} // namespace fwbuild::catalog
