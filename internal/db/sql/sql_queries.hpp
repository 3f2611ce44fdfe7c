#pragma once

namespace liveviewer::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  IN (...) lists are expanded by the repository; the constants here
  hold the fixed statements only.
*/

// sessions

static constexpr const char* UPSERT_SESSION =
    "INSERT INTO live_sessions(session_id,theme,host_id,host_name,start_time_ms,duration_seconds)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(session_id) DO UPDATE SET theme=excluded.theme, host_id=excluded.host_id,"
    " host_name=excluded.host_name, start_time_ms=excluded.start_time_ms,"
    " duration_seconds=excluded.duration_seconds;";

static constexpr const char* SELECT_SESSION_ID =
    "SELECT id FROM live_sessions WHERE session_id=?;";

static constexpr const char* SELECT_SESSION =
    "SELECT id,session_id,theme,host_id,host_name,start_time_ms,duration_seconds"
    " FROM live_sessions WHERE session_id=?;";

// viewers

static constexpr const char* VIEWER_COLUMNS =
    "id,session_id,participant_id,kind,display_name,watch_seconds,watch_percentage,commented,used_mic,"
    "signed_in,last_sign_time_ms,sign_count,inviter_id,inviter_kind,inviter_name,invited_by_host,"
    "reward_eligible,reward_amount,reward_status,created_at_ms,updated_at_ms,"
    "first_enter_time_ms,last_leave_time_ms,comment_count,mic_seconds";

static constexpr const char* INSERT_VIEWER =
    "INSERT INTO live_viewers(session_id,participant_id,kind,display_name,watch_seconds,watch_percentage,"
    "commented,used_mic,signed_in,last_sign_time_ms,sign_count,inviter_id,inviter_kind,inviter_name,"
    "invited_by_host,reward_eligible,reward_amount,reward_status,first_enter_time_ms,last_leave_time_ms,"
    "comment_count,mic_seconds,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_VIEWER =
    "UPDATE live_viewers SET session_id=?,participant_id=?,kind=?,display_name=?,watch_seconds=?,"
    "watch_percentage=?,commented=?,used_mic=?,signed_in=?,last_sign_time_ms=?,sign_count=?,"
    "inviter_id=?,inviter_kind=?,inviter_name=?,invited_by_host=?,reward_eligible=?,reward_amount=?,"
    "reward_status=?,first_enter_time_ms=?,last_leave_time_ms=?,comment_count=?,mic_seconds=?,"
    "updated_at_ms=? WHERE id=?;";

static constexpr const char* SELECT_ANY_PARTICIPANT_NAME =
    "SELECT display_name FROM live_viewers WHERE participant_id=? AND display_name<>''"
    " ORDER BY id DESC LIMIT 1;";

static constexpr const char* UPDATE_REWARD_SUMMARY =
    "UPDATE live_viewers SET reward_eligible=?,reward_amount=?,reward_status=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* UPDATE_SIGN_SUMMARY =
    "UPDATE live_viewers SET signed_in=?,last_sign_time_ms=?,sign_count=?,updated_at_ms=? WHERE id=?;";

// sign records

static constexpr const char* INSERT_SIGN_RECORD =
    "INSERT INTO live_sign_records(session_id,viewer_record_id,sign_time_ms,sign_type,sequence,valid)"
    " VALUES(?,?,?,?,?,?);";

// rewards

static constexpr const char* REWARD_COLUMNS =
    "id,session_id,viewer_record_id,rule_type,rule_sign_count,rule_watch_seconds,rule_watch_count,"
    "calculation_batch_id,reward_amount,eligible,created_at_ms,updated_at_ms";

static constexpr const char* INSERT_REWARD =
    "INSERT INTO live_reward_records(session_id,viewer_record_id,rule_type,rule_sign_count,"
    "rule_watch_seconds,rule_watch_count,calculation_batch_id,reward_amount,eligible,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

// inviter cache

static constexpr const char* UPSERT_INVITER_NAME =
    "INSERT INTO inviter_cache(inviter_id,name,updated_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(inviter_id) DO UPDATE SET name=excluded.name, updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_INVITER_NAMES =
    "SELECT inviter_id,name,updated_at_ms FROM inviter_cache;";

} // namespace liveviewer::db::sql
