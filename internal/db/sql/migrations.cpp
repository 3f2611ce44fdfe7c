#include "migrations.hpp"

namespace liveviewer::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int current = executor.CurrentVersion();
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    const int version = static_cast<int>(i) + 1;
    if (version <= current) continue;
    executor.ExecuteSQL(ordered_sql[i]);
    executor.RecordVersion(version);
  }
}

const std::vector<std::string>& ViewerStoreMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: sessions
      "CREATE TABLE IF NOT EXISTS live_sessions ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " session_id TEXT NOT NULL UNIQUE,"
      " theme TEXT NOT NULL DEFAULT '',"
      " host_id TEXT NOT NULL DEFAULT '',"
      " host_name TEXT NOT NULL DEFAULT '',"
      " start_time_ms INTEGER NOT NULL DEFAULT 0,"
      " duration_seconds INTEGER NOT NULL DEFAULT 0);",

      // 2: viewers
      "CREATE TABLE IF NOT EXISTS live_viewers ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " session_id TEXT NOT NULL,"
      " participant_id TEXT NOT NULL,"
      " kind INTEGER NOT NULL,"
      " display_name TEXT NOT NULL DEFAULT '',"
      " watch_seconds INTEGER NOT NULL DEFAULT 0 CHECK (watch_seconds >= 0),"
      " watch_percentage REAL NOT NULL DEFAULT 0,"
      " commented INTEGER NOT NULL DEFAULT 0,"
      " used_mic INTEGER NOT NULL DEFAULT 0,"
      " signed_in INTEGER NOT NULL DEFAULT 0,"
      " last_sign_time_ms INTEGER,"
      " sign_count INTEGER NOT NULL DEFAULT 0 CHECK (sign_count >= 0),"
      " inviter_id TEXT,"
      " inviter_kind INTEGER,"
      " inviter_name TEXT,"
      " invited_by_host INTEGER NOT NULL DEFAULT 0,"
      " reward_eligible INTEGER NOT NULL DEFAULT 0,"
      " reward_amount REAL NOT NULL DEFAULT 0 CHECK (reward_amount >= 0),"
      " reward_status TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " UNIQUE(session_id, kind, participant_id),"
      " CHECK (reward_amount = 0 OR reward_eligible = 1));",

      // 3: sign-in details
      "CREATE TABLE IF NOT EXISTS live_sign_records ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " session_id TEXT NOT NULL,"
      " viewer_record_id INTEGER NOT NULL REFERENCES live_viewers(id),"
      " sign_time_ms INTEGER NOT NULL,"
      " sign_type TEXT NOT NULL DEFAULT '',"
      " sequence INTEGER NOT NULL DEFAULT 1,"
      " valid INTEGER NOT NULL DEFAULT 1);"
      "CREATE INDEX IF NOT EXISTS idx_sign_records_session ON live_sign_records(session_id);",

      // 4: rewards
      "CREATE TABLE IF NOT EXISTS live_reward_records ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " session_id TEXT NOT NULL,"
      " viewer_record_id INTEGER NOT NULL REFERENCES live_viewers(id),"
      " rule_type TEXT NOT NULL,"
      " rule_sign_count INTEGER NOT NULL DEFAULT 0,"
      " rule_watch_seconds INTEGER NOT NULL DEFAULT 0,"
      " rule_watch_count INTEGER NOT NULL DEFAULT 0,"
      " calculation_batch_id TEXT NOT NULL,"
      " reward_amount REAL NOT NULL DEFAULT 0,"
      " eligible INTEGER NOT NULL DEFAULT 0,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS idx_reward_records_session ON live_reward_records(session_id);"
      "CREATE INDEX IF NOT EXISTS idx_reward_records_batch ON live_reward_records(calculation_batch_id);",

      // 5: inviter name cache
      "CREATE TABLE IF NOT EXISTS inviter_cache ("
      " inviter_id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      // 6: attendance details
      "ALTER TABLE live_viewers ADD COLUMN first_enter_time_ms INTEGER;"
      "ALTER TABLE live_viewers ADD COLUMN last_leave_time_ms INTEGER;"
      "ALTER TABLE live_viewers ADD COLUMN comment_count INTEGER NOT NULL DEFAULT 0 CHECK (comment_count >= 0);"
      "ALTER TABLE live_viewers ADD COLUMN mic_seconds INTEGER NOT NULL DEFAULT 0 CHECK (mic_seconds >= 0);",
  };
  return kMigrations;
}

} // namespace liveviewer::db::sql
