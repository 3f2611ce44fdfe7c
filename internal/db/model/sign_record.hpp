#pragma once

#include <cstdint>
#include <string>

namespace liveviewer::db::model {

// Sign-in detail row produced by the sign import collaborator.
struct SignRecord {
  int64_t     id = 0;
  std::string session_id;
  int64_t     viewer_record_id = 0;
  uint64_t    sign_time_ms     = 0;
  std::string sign_type;
  int32_t     sequence = 1;
  bool        valid    = true;
};

// Aggregate of valid sign records for one viewer row.
struct SignAggregate {
  int64_t  count             = 0;
  uint64_t last_sign_time_ms = 0;
};

} // namespace liveviewer::db::model
