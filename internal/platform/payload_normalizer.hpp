#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/participant.hpp"
#include "liveviewer/platform/v1.hpp"

namespace liveviewer::platform {

/*
  One participant as seen on one statistics page, in fixed shape.

  Inviter fallback order (same for both kinds):
    1. inviter of the participant's own kind
       (invitor_userid for members, invitor_external_userid for contacts)
    2. inviter of the other kind
    3. none
*/
struct ParticipantSighting {
  liveviewer::model::ParticipantKind kind = liveviewer::model::ParticipantKind::kInternal;
  std::string                        participant_id;
  std::string                        display_name;

  int64_t watch_seconds = 0;
  bool    commented     = false;
  bool    used_mic      = false;

  std::optional<uint64_t> first_enter_time_ms;
  std::optional<uint64_t> last_leave_time_ms;
  int64_t                 comment_count = 0;
  int64_t                 mic_seconds   = 0;

  std::optional<std::string>                        inviter_id;
  std::optional<liveviewer::model::ParticipantKind> inviter_kind;
};

// Normalized contents of one page.
struct NormalizedPage {
  std::vector<ParticipantSighting> internal;
  std::vector<ParticipantSighting> external;

  // participant id -> display name, for identity resolution
  std::unordered_map<std::string, std::string> name_hints;

  std::size_t malformed = 0;
};

// Throws util::InvalidArgument when the participant id is missing, a count or duration is
// negative, or the participant left before entering.
ParticipantSighting Normalize(const wire::WatchStatUser& user);
ParticipantSighting Normalize(const wire::WatchStatExternalUser& user);

// Removes the "@微信" suffix the platform appends to WeChat contacts.
std::string CleanExternalName(const std::string& name);

// Malformed entries are logged, counted and skipped.
NormalizedPage NormalizePage(const wire::WatchStatResponse& page);

} // namespace liveviewer::platform
