#include "payload_normalizer.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace liveviewer::platform {

using liveviewer::model::ParticipantKind;

namespace {

constexpr std::string_view kWeChatSuffix = "@微信";

void SetInviter(ParticipantSighting& s, const std::string& own_kind_id, ParticipantKind own_kind,
                const std::string& other_kind_id, ParticipantKind other_kind) {
  if (!own_kind_id.empty()) {
    s.inviter_id   = own_kind_id;
    s.inviter_kind = own_kind;
  } else if (!other_kind_id.empty()) {
    s.inviter_id   = other_kind_id;
    s.inviter_kind = other_kind;
  }

  // self-invitation carries no information
  if (s.inviter_id && *s.inviter_id == s.participant_id) {
    s.inviter_id.reset();
    s.inviter_kind.reset();
  }
}

std::optional<uint64_t> EpochSecondsToMillis(int64_t seconds) {
  if (seconds <= 0) return std::nullopt;
  return static_cast<uint64_t>(seconds) * 1000;
}

// Both statistics entry types carry the same attendance fields.
template <typename WireUser>
void SetAttendance(ParticipantSighting& s, const WireUser& user) {
  s.first_enter_time_ms = EpochSecondsToMillis(user.first_enter_time());
  s.last_leave_time_ms  = EpochSecondsToMillis(user.last_leave_time());
  s.comment_count       = user.comment_count();
  s.mic_seconds         = user.mic_duration();
}

void CheckCommon(const ParticipantSighting& s, const char* id_field) {
  if (s.participant_id.empty()) {
    throw util::InvalidArgument(std::string("participant without ") + id_field);
  }
  if (s.watch_seconds < 0) {
    throw util::InvalidArgument("negative watch_time for " + s.participant_id);
  }
  if (s.comment_count < 0 || s.mic_seconds < 0) {
    throw util::InvalidArgument("negative comment_count or mic_duration for " + s.participant_id);
  }
  if (s.first_enter_time_ms && s.last_leave_time_ms && *s.last_leave_time_ms < *s.first_enter_time_ms) {
    throw util::InvalidArgument("last_leave_time before first_enter_time for " + s.participant_id);
  }
}

} // namespace

std::string CleanExternalName(const std::string& name) {
  if (name.size() >= kWeChatSuffix.size() &&
      name.compare(name.size() - kWeChatSuffix.size(), kWeChatSuffix.size(), kWeChatSuffix) == 0) {
    return name.substr(0, name.size() - kWeChatSuffix.size());
  }
  return name;
}

ParticipantSighting Normalize(const wire::WatchStatUser& user) {
  ParticipantSighting s;
  s.kind           = ParticipantKind::kInternal;
  s.participant_id = user.userid();
  s.display_name   = user.name();
  s.watch_seconds  = user.watch_time();
  s.commented      = user.is_comment() != 0;
  s.used_mic       = user.is_mic() != 0;
  SetAttendance(s, user);
  CheckCommon(s, "userid");

  SetInviter(s, user.invitor_userid(), ParticipantKind::kInternal, user.invitor_external_userid(),
             ParticipantKind::kExternal);
  return s;
}

ParticipantSighting Normalize(const wire::WatchStatExternalUser& user) {
  ParticipantSighting s;
  s.kind           = ParticipantKind::kExternal;
  s.participant_id = user.external_userid();
  s.display_name   = CleanExternalName(user.name());
  s.watch_seconds  = user.watch_time();
  s.commented      = user.is_comment() != 0;
  s.used_mic       = user.is_mic() != 0;
  SetAttendance(s, user);
  CheckCommon(s, "external_userid");

  SetInviter(s, user.invitor_external_userid(), ParticipantKind::kExternal, user.invitor_userid(),
             ParticipantKind::kInternal);
  return s;
}

NormalizedPage NormalizePage(const wire::WatchStatResponse& page) {
  NormalizedPage out;
  out.internal.reserve(page.stat_info().users_size());
  out.external.reserve(page.stat_info().external_users_size());

  auto accept = [&out](std::vector<ParticipantSighting>& dst, ParticipantSighting s) {
    if (!s.display_name.empty()) out.name_hints[s.participant_id] = s.display_name;
    dst.push_back(std::move(s));
  };

  for (const auto& user : page.stat_info().users()) {
    try {
      accept(out.internal, Normalize(user));
    } catch (const util::InvalidArgument& e) {
      ++out.malformed;
      LIVEVIEWER_LOG_WARN("skipping malformed participant", {observability::StringField("kind", "internal"),
                                                             observability::StringField("error", e.what())});
    }
  }

  for (const auto& user : page.stat_info().external_users()) {
    try {
      accept(out.external, Normalize(user));
    } catch (const util::InvalidArgument& e) {
      ++out.malformed;
      LIVEVIEWER_LOG_WARN("skipping malformed participant", {observability::StringField("kind", "external"),
                                                             observability::StringField("error", e.what())});
    }
  }

  return out;
}

} // namespace liveviewer::platform
