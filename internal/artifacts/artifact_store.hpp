#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fwbuild::artifacts {

/*
  Append-only sink for one build's log. Every write is flushed so readers
  see output of a RUNNING build as it is produced.

  Single writer per build; not thread-safe.
*/
class LogWriter {
 public:
  explicit LogWriter(const std::filesystem::path& path);

  void Write(std::string_view bytes);
  void WriteLine(std::string_view line);

 private:
  std::ofstream out_;
};

/*
  Filesystem artifact and log store, addressed by build id:

    <root>/<build_id>/build.log
    <root>/<build_id>/artifacts/<file>
    <root>/<build_id>/SEALED

  Refs handed out are relative to root ("<build_id>/build.log"). After
  Seal() the build's files are immutable; writers are refused.
*/
class ArtifactStore {
 public:
  explicit ArtifactStore(std::filesystem::path root);

  std::unique_ptr<LogWriter> OpenLogWriter(const std::string& build_id);

  // Copies the file in atomically; returns its artifact_ref.
  std::string PutArtifact(const std::string& build_id, const std::filesystem::path& file);

  // Bytes of the primary (lexicographically first) artifact. Throws NotFound.
  std::string GetArtifact(const std::string& build_id) const;
  std::string GetArtifact(const std::string& build_id, const std::string& name) const;

  std::vector<std::string> ListArtifacts(const std::string& build_id) const;

  // Whole log, or only the last tail_lines lines. Throws NotFound.
  std::string GetLog(const std::string& build_id, std::size_t tail_lines = 0) const;
  bool        HasLog(const std::string& build_id) const;

  void Seal(const std::string& build_id);
  bool IsSealed(const std::string& build_id) const;

  void Remove(const std::string& build_id);

  std::string LogRef(const std::string& build_id) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  void EnsureWritable(const std::string& build_id) const;

  std::filesystem::path root_;
};

} // namespace fwbuild::artifacts
