#pragma once

#include <cstdint>
#include <string>

namespace liveviewer::db::model {

struct InviterCacheRecord {
  std::string inviter_id;
  std::string name;
  uint64_t    updated_at_ms = 0;
};

} // namespace liveviewer::db::model
