#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/catalog/metadata_catalog.hpp"

namespace fwbuild::catalog {

/*
  Catalog backed by a YAML file that an external refresh job rewrites.

  The file is re-read whenever its modification time changes. A file that
  is missing or fails to parse makes Lookup throw CatalogUnavailable; the
  last good copy is not served in its place.
*/
class FileCatalog final : public MetadataCatalog {
 public:
  explicit FileCatalog(std::filesystem::path path);

  std::optional<fwbuild::v1::CatalogVersion> Lookup(const std::string& vehicle, const std::string& version_id,
                                                    const std::string& board) override;

 private:
  std::shared_ptr<const fwbuild::v1::Catalog> Current();

  std::filesystem::path path_;

  std::shared_mutex                           mutex_;
  std::filesystem::file_time_type             loaded_mtime_{};
  std::shared_ptr<const fwbuild::v1::Catalog> catalog_;
};

} // namespace fwbuild::catalog
