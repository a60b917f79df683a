#pragma once

#include <optional>
#include <string>

#include "fwbuild/v1.hpp"

namespace fwbuild::catalog {

/*
  Read-only reference data: which versions exist per vehicle, which boards
  each version supports and which feature defines it knows.

  Lookup returns nullopt when the (vehicle, version, board) combination does
  not exist. It throws util::CatalogUnavailable when the data cannot be read;
  callers never treat that as "no constraints".
*/
class MetadataCatalog {
 public:
  virtual ~MetadataCatalog() = default;

  virtual std::optional<fwbuild::v1::CatalogVersion> Lookup(const std::string& vehicle, const std::string& version_id,
                                                            const std::string& board) = 0;
};

// Shared matching rules. Vehicle names compare case-insensitively.
std::optional<fwbuild::v1::CatalogVersion> FindVersion(const fwbuild::v1::Catalog& catalog, const std::string& vehicle,
                                                       const std::string& version_id, const std::string& board);

// Catalog held in memory, fixed at construction.
class StaticCatalog final : public MetadataCatalog {
 public:
  explicit StaticCatalog(fwbuild::v1::Catalog catalog) : catalog_(std::move(catalog)) {
  }

  std::optional<fwbuild::v1::CatalogVersion> Lookup(const std::string& vehicle, const std::string& version_id,
                                                    const std::string& board) override {
    return FindVersion(catalog_, vehicle, version_id, board);
  }

 private:
  fwbuild::v1::Catalog catalog_;
};

} // namespace fwbuild::catalog
