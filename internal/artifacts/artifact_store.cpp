#include "internal/artifacts/artifact_store.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/artifacts/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace fwbuild::artifacts {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLogName     = "build.log";
constexpr const char* kArtifactDir = "artifacts";
constexpr const char* kSealMarker  = "SEALED";

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::NotFound(path.string());
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::string LastLines(const std::string& text, std::size_t count) {
  if (count == 0 || text.empty()) return text;

  // a trailing newline terminates the last line, it does not start a new one
  std::size_t end = text.size();
  if (text.back() == '\n') --end;

  std::size_t pos = end;
  while (pos > 0) {
    auto nl = text.rfind('\n', pos - 1);
    if (nl == std::string::npos) return text;
    if (--count == 0) return text.substr(nl + 1);
    pos = nl;
  }
  return text;
}

} // namespace

LogWriter::LogWriter(const fs::path& path) : out_(path, std::ios::binary | std::ios::app) {
  if (!out_) throw std::runtime_error("cannot open log " + path.string());
}

void LogWriter::Write(std::string_view bytes) {
  out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out_.flush();
  if (!out_) throw std::runtime_error("log write failed");
}

void LogWriter::WriteLine(std::string_view line) {
  std::string buffer(line);
  buffer.push_back('\n');
  Write(buffer);
}

ArtifactStore::ArtifactStore(fs::path root) : root_(std::move(root)) {
  fs::create_directories(root_);
}

void ArtifactStore::EnsureWritable(const std::string& build_id) const {
  if (IsSealed(build_id)) {
    throw util::InvalidState("artifacts of build " + build_id + " are sealed");
  }
}

std::unique_ptr<LogWriter> ArtifactStore::OpenLogWriter(const std::string& build_id) {
  auto dir = BuildDir(root_, build_id);
  EnsureWritable(build_id);
  fs::create_directories(dir);
  return std::make_unique<LogWriter>(dir / kLogName);
}

/*
  Atomic copy:
      copy → tmp, rename tmp → final
*/
std::string ArtifactStore::PutArtifact(const std::string& build_id, const fs::path& file) {
  auto dir = BuildDir(root_, build_id) / kArtifactDir;
  EnsureWritable(build_id);
  fs::create_directories(dir);

  auto name = file.filename().string();
  auto tmp  = dir / (name + ".tmp");
  fs::copy_file(file, tmp, fs::copy_options::overwrite_existing);
  fs::rename(tmp, dir / name);

  return build_id + "/" + kArtifactDir + "/" + name;
}

std::vector<std::string> ArtifactStore::ListArtifacts(const std::string& build_id) const {
  auto dir = BuildDir(root_, build_id) / kArtifactDir;

  std::vector<std::string> names;
  std::error_code          ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    auto name = it->path().filename().string();
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".tmp") == 0) continue;
    names.push_back(std::move(name));
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string ArtifactStore::GetArtifact(const std::string& build_id) const {
  auto names = ListArtifacts(build_id);
  if (names.empty()) throw util::NotFound("no artifact for build " + build_id);
  return GetArtifact(build_id, names.front());
}

std::string ArtifactStore::GetArtifact(const std::string& build_id, const std::string& name) const {
  ValidateBuildId(name);
  auto path = BuildDir(root_, build_id) / kArtifactDir / name;
  if (!fs::is_regular_file(path)) throw util::NotFound("artifact " + name + " of build " + build_id);
  return ReadFile(path);
}

std::string ArtifactStore::GetLog(const std::string& build_id, std::size_t tail_lines) const {
  auto path = BuildDir(root_, build_id) / kLogName;
  if (!fs::is_regular_file(path)) throw util::NotFound("no log for build " + build_id);
  return LastLines(ReadFile(path), tail_lines);
}

bool ArtifactStore::HasLog(const std::string& build_id) const {
  return fs::is_regular_file(BuildDir(root_, build_id) / kLogName);
}

void ArtifactStore::Seal(const std::string& build_id) {
  auto dir = BuildDir(root_, build_id);
  fs::create_directories(dir);
  std::ofstream marker(dir / kSealMarker);
  if (!marker) throw std::runtime_error("cannot seal " + dir.string());
}

bool ArtifactStore::IsSealed(const std::string& build_id) const {
  return fs::exists(BuildDir(root_, build_id) / kSealMarker);
}

void ArtifactStore::Remove(const std::string& build_id) {
  fs::remove_all(BuildDir(root_, build_id));
}

std::string ArtifactStore::LogRef(const std::string& build_id) const {
  ValidateBuildId(build_id);
  return build_id + "/" + kLogName;
}

} // namespace fwbuild::artifacts
