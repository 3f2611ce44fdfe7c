#pragma once

#include <cstdint>
#include <string>

#include "internal/model/reward_rule.hpp"

namespace liveviewer::db::model {

/*
  One row per (session, viewer, calculation batch).
*/
struct RewardRecord {
  int64_t     id = 0;
  std::string session_id;
  int64_t     viewer_record_id = 0;

  liveviewer::model::RewardRuleType rule_type = liveviewer::model::RewardRuleType::kAllOf;

  int64_t rule_sign_count    = 0;
  int64_t rule_watch_seconds = 0;
  int64_t rule_watch_count   = 0;

  std::string calculation_batch_id;
  double      reward_amount = 0.0;
  bool        eligible      = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace liveviewer::db::model
