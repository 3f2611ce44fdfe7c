#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/reward_rule.hpp"
#include "internal/util/time.hpp"

namespace liveviewer::reward {

// Operator settings for one selected session.
struct SessionRule {
  std::string session_id;
  int64_t     rule_sign_count    = 0;
  int64_t     rule_watch_seconds = 0;
  double      reward_amount      = 0.0;
};

struct RewardRequest {
  std::vector<SessionRule>          sessions;
  liveviewer::model::RewardRuleType rule_type                      = liveviewer::model::RewardRuleType::kAllOf;
  int64_t                           min_cross_session_watch_count = 0;
  std::string                       batch_id;
};

struct RewardOutcome {
  bool        success = false;
  std::string message;
  std::size_t processed      = 0;
  std::size_t eligible_count = 0;
  double      total_amount   = 0.0;
};

struct RuleMismatch {
  std::string session_id;
  std::string batch_id;
  std::string field;
  std::string expected;
  std::string actual;
};

struct ConsistencyReport {
  bool                      consistent = true;
  std::vector<RuleMismatch> mismatches;
  std::vector<std::string>  sessions_without_rewards;

  // set when the store could not be read; consistent is false then
  std::string error;
};

/*
  Evaluates one reward rule across a batch of sessions.

  A computation fully replaces the reward rows of the selected sessions
  and rewrites each viewer's reward summary, in one transaction.
  Cross-session count is the number of selected sessions in which the
  same participant (kind + id) appears.
*/
class RewardRuleEngine {
 public:
  explicit RewardRuleEngine(std::shared_ptr<db::Repository> repo);

  RewardOutcome ComputeRewards(const RewardRequest& request);

  // Compares sampled reward rows with the current settings. A mismatch is a signal, not an error.
  // Reward rows whose rule type cannot be decoded count as rule_type mismatches.
  ConsistencyReport CheckRuleConsistency(const std::vector<SessionRule>& sessions,
                                         liveviewer::model::RewardRuleType rule_type,
                                         int64_t min_cross_session_watch_count, std::size_t samples_per_session);

  // <yyyyMMddHHmmss>-<operator>-<rule wire>
  static std::string GenerateBatchId(const std::string& operator_id, liveviewer::model::RewardRuleType rule_type,
                                     util::TimePoint now);

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace liveviewer::reward
