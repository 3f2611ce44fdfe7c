#include "reward_rule.hpp"

namespace liveviewer::model {

std::string_view ToWire(RewardRuleType type) {
  switch (type) {
    case RewardRuleType::kSign:
      return "sign";
    case RewardRuleType::kWatch:
      return "watch";
    case RewardRuleType::kCount:
      return "count";
    case RewardRuleType::kSignAndWatch:
      return "sign-watch";
    case RewardRuleType::kSignAndCount:
      return "sign-count";
    case RewardRuleType::kWatchAndCount:
      return "watch-count";
    case RewardRuleType::kAnyOf:
      return "all-or";
    case RewardRuleType::kAllOf:
      return "all-and";
  }
  return "all-and";
}

std::optional<RewardRuleType> ParseRewardRuleType(std::string_view wire) {
  for (const auto type : kAllRewardRuleTypes) {
    if (ToWire(type) == wire) return type;
  }
  return std::nullopt;
}

bool IsEligible(RewardRuleType type, const EligibilityFacts& facts, const EligibilityThresholds& thresholds) {
  const bool sign  = facts.sign_count >= thresholds.sign_count;
  const bool watch = facts.watch_seconds >= thresholds.watch_seconds;
  const bool count = facts.cross_session_count >= thresholds.cross_session_count;

  switch (type) {
    case RewardRuleType::kSign:
      return sign;
    case RewardRuleType::kWatch:
      return watch;
    case RewardRuleType::kCount:
      return count;
    case RewardRuleType::kSignAndWatch:
      return sign && watch;
    case RewardRuleType::kSignAndCount:
      return sign && count;
    case RewardRuleType::kWatchAndCount:
      return watch && count;
    case RewardRuleType::kAnyOf:
      return sign || watch || count;
    case RewardRuleType::kAllOf:
      return sign && watch && count;
  }
  return false;
}

} // namespace liveviewer::model
