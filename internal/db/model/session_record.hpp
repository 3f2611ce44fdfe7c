#pragma once

#include <cstdint>
#include <string>

namespace liveviewer::db::model {

/*
  Live session row. Written by the session management layer; the
  ingestion core only reads it (host identity, duration).
*/
struct SessionRecord {
  int64_t     id = 0;
  std::string session_id;
  std::string theme;
  std::string host_id;
  std::string host_name;
  uint64_t    start_time_ms    = 0;
  int64_t     duration_seconds = 0;
};

} // namespace liveviewer::db::model
