#include "internal/catalog/file_catalog.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using fwbuild::catalog::FileCatalog;

constexpr const char* kCatalogV1 = R"(vehicles:
  - name: Copter
    versions:
      - id: "stable-4.5"
        remote: ardupilot
        commit_ref: "refs/tags/Copter-4.5.7"
        release_type: stable
        version_number: "4.5.7"
        boards: [SPEDIXF405, MatekH743]
        features:
          - define: HAL_EXTERNAL_AHRS_ENABLED
            label: External AHRS
            category: AHRS
            default_enabled: false
          - define: AP_GPS_UBLOX_ENABLED
            label: uBlox GPS
            category: GPS
            default_enabled: true
            depends: [AP_GPS_ENABLED]
          - define: AP_GPS_ENABLED
            label: GPS
            category: GPS
  - name: Plane
    versions:
      - id: "beta-4.6"
        commit_ref: "refs/heads/master"
        boards: [MatekH743]
)";

constexpr const char* kCatalogV2 = R"(vehicles:
  - name: Copter
    versions:
      - id: "stable-4.6"
        commit_ref: "refs/tags/Copter-4.6.0"
        boards: [SPEDIXF405]
)";

fs::path MakeDir() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  auto       dir   = fs::temp_directory_path() / ("fwbuild_file_catalog_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

void Write(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

// Moves the mtime forward so a rewrite is never hidden by timestamp granularity.
void Touch(const fs::path& path, int step) {
  fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(step));
}

bool Unavailable(FileCatalog& catalog) {
  try {
    (void)catalog.Lookup("copter", "stable-4.5", "SPEDIXF405");
  } catch (const fwbuild::util::CatalogUnavailable&) {
    return true;
  }
  return false;
}

void TestLookupMatchesVehicleVersionAndBoard() {
  auto dir  = MakeDir();
  auto path = dir / "catalog.yaml";
  Write(path, kCatalogV1);

  FileCatalog catalog(path);

  auto version = catalog.Lookup("copter", "stable-4.5", "SPEDIXF405");
  assert(version.has_value());
  assert(version->commit_ref() == "refs/tags/Copter-4.5.7");
  assert(version->features_size() == 3);
  assert(version->features(1).depends_size() == 1);
  assert(version->features(1).default_enabled());

  // vehicle names are case-insensitive; boards are not
  assert(catalog.Lookup("COPTER", "stable-4.5", "MatekH743").has_value());
  assert(!catalog.Lookup("copter", "stable-4.5", "spedixf405").has_value());
  assert(!catalog.Lookup("copter", "stable-9.9", "SPEDIXF405").has_value());
  assert(!catalog.Lookup("rover", "stable-4.5", "SPEDIXF405").has_value());
  assert(!catalog.Lookup("plane", "beta-4.6", "SPEDIXF405").has_value());
  assert(catalog.Lookup("plane", "beta-4.6", "MatekH743").has_value());

  fs::remove_all(dir);
}

void TestRewriteIsPickedUp() {
  auto dir  = MakeDir();
  auto path = dir / "catalog.yaml";
  Write(path, kCatalogV1);

  FileCatalog catalog(path);
  assert(catalog.Lookup("copter", "stable-4.5", "SPEDIXF405").has_value());

  Write(path, kCatalogV2);
  Touch(path, 2);

  assert(!catalog.Lookup("copter", "stable-4.5", "SPEDIXF405").has_value());
  assert(catalog.Lookup("copter", "stable-4.6", "SPEDIXF405").has_value());

  fs::remove_all(dir);
}

void TestUnreadableCatalogIsUnavailable() {
  auto dir  = MakeDir();
  auto path = dir / "catalog.yaml";

  FileCatalog catalog(path);
  assert(Unavailable(catalog));

  Write(path, kCatalogV1);
  assert(!Unavailable(catalog));

  // a broken rewrite does not fall back to the previous copy
  Write(path, "vehicles:\n  - name: Copter\n    bogus_field: 1\n");
  Touch(path, 4);
  assert(Unavailable(catalog));

  fs::remove(path);
  assert(Unavailable(catalog));

  fs::remove_all(dir);
}

} // namespace

int main() {
  TestLookupMatchesVehicleVersionAndBoard();
  TestRewriteIsPickedUp();
  TestUnreadableCatalogIsUnavailable();

  std::cout << "fwbuild_unit_file_catalog: pass\n";
  return 0;
}
