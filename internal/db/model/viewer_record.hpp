#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/participant.hpp"

namespace liveviewer::db::model {

inline constexpr const char* kRewardStatusNone       = "";
inline constexpr const char* kRewardStatusPending    = "pending";
inline constexpr const char* kRewardStatusIneligible = "ineligible";

/*
  One row per (session, participant).

  IMPORTANT:
  - (session_id, kind, participant_id) is unique.
  - reward_amount > 0 implies reward_eligible.
  - id is assigned by the store on insert (0 = not yet persisted).
*/
struct ViewerRecord {
  int64_t id = 0;

  std::string                        session_id;
  std::string                        participant_id;
  liveviewer::model::ParticipantKind kind = liveviewer::model::ParticipantKind::kInternal;
  std::string                        display_name;

  int64_t watch_seconds    = 0;
  double  watch_percentage = 0.0;
  bool    commented        = false;
  bool    used_mic         = false;

  std::optional<uint64_t> first_enter_time_ms;
  std::optional<uint64_t> last_leave_time_ms;
  int64_t                 comment_count = 0;
  int64_t                 mic_seconds   = 0;

  bool                    signed_in = false;
  std::optional<uint64_t> last_sign_time_ms;
  int64_t                 sign_count = 0;

  std::optional<std::string>                        inviter_id;
  std::optional<liveviewer::model::ParticipantKind> inviter_kind;
  std::optional<std::string>                        inviter_name;
  bool                                              invited_by_host = false;

  bool        reward_eligible = false;
  double      reward_amount   = 0.0;
  std::string reward_status;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  liveviewer::model::ViewerKey Key() const {
    return {session_id, kind, participant_id};
  }
};

// Resolved inviter written by the invitation backfill.
struct InvitationUpdate {
  int64_t     viewer_id = 0;
  std::string inviter_name;
  bool        invited_by_host = false;
};

// Reward summary written by the reward engine.
struct RewardSummaryUpdate {
  int64_t     viewer_id       = 0;
  bool        reward_eligible = false;
  double      reward_amount   = 0.0;
  std::string reward_status;
};

// Sign-in summary written by sign synchronization.
struct SignSummaryUpdate {
  int64_t                 viewer_id = 0;
  bool                    signed_in = false;
  std::optional<uint64_t> last_sign_time_ms;
  int64_t                 sign_count = 0;
};

} // namespace liveviewer::db::model
