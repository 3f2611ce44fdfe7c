#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace liveviewer::model {

/*
  Reward eligibility rule.

  Wire form (persisted in reward rows and batch ids):
    sign, watch, count, sign-watch, sign-count, watch-count, all-or, all-and
*/
enum class RewardRuleType : std::uint8_t {
  kSign,
  kWatch,
  kCount,
  kSignAndWatch,
  kSignAndCount,
  kWatchAndCount,
  kAnyOf,
  kAllOf,
};

inline constexpr RewardRuleType kAllRewardRuleTypes[] = {
    RewardRuleType::kSign,         RewardRuleType::kWatch,         RewardRuleType::kCount,
    RewardRuleType::kSignAndWatch, RewardRuleType::kSignAndCount,  RewardRuleType::kWatchAndCount,
    RewardRuleType::kAnyOf,        RewardRuleType::kAllOf,
};

std::string_view              ToWire(RewardRuleType type);
std::optional<RewardRuleType> ParseRewardRuleType(std::string_view wire);

// Observed values for one (session, participant) pair.
struct EligibilityFacts {
  std::int64_t sign_count          = 0;
  std::int64_t watch_seconds       = 0;
  std::int64_t cross_session_count = 0;
};

struct EligibilityThresholds {
  std::int64_t sign_count          = 0;
  std::int64_t watch_seconds       = 0;
  std::int64_t cross_session_count = 0;
};

bool IsEligible(RewardRuleType type, const EligibilityFacts& facts, const EligibilityThresholds& thresholds);

} // namespace liveviewer::model
