#pragma once

#include <cstdint>
#include <string>

namespace fwbuild::db::model {

/*
  Persistent build row.

  IMPORTANT:
  - One row per build id, holding every Build field.
  - Timestamps are unix milliseconds; 0 means "not set".
  - workspace_id is -1 unless the build is RUNNING.
  - features is the normalized feature list joined with '\n'.
*/

struct BuildRecord {
  std::string id;
  uint64_t    sequence = 0;

  std::string vehicle;
  std::string board;
  std::string version_id;
  std::string features;
  std::string request_hash;

  int     state        = 0;
  int64_t workspace_id = -1;

  uint64_t created_at_ms  = 0;
  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;

  int         error_kind = 0;
  std::string error_message;

  std::string artifact_ref;
  std::string log_ref;
};

} // namespace fwbuild::db::model
