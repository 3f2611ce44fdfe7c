#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace liveviewer::db::sqlite {

using liveviewer::db::ErrorCode;
using liveviewer::db::Result;
using liveviewer::model::ParticipantKind;

namespace {

// IN (...) lists are split so no statement exceeds the host parameter limit.
constexpr std::size_t kMaxInList = 500;

// Rows per multi-row invitation update.
constexpr std::size_t kMaxUpdateRows = 1000;

class Stmt {
 public:
  Stmt(sqlite3* db, const std::string& sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Stmt() {
    if (st_) sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptKind(sqlite3_stmt* st, int idx, const std::optional<ParticipantKind>& kind) {
  if (kind) {
    sqlite3_bind_int(st, idx, liveviewer::model::ToStorage(*kind));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

std::string Placeholders(std::size_t n) {
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out += ',';
    out += '?';
  }
  return out;
}

template <typename T>
std::vector<std::vector<T>> Chunk(const std::vector<T>& values, std::size_t size) {
  std::vector<std::vector<T>> chunks;
  for (std::size_t i = 0; i < values.size(); i += size) {
    const auto end = std::min(values.size(), i + size);
    chunks.emplace_back(values.begin() + i, values.begin() + end);
  }
  return chunks;
}

model::ViewerRecord ReadViewer(sqlite3_stmt* st) {
  model::ViewerRecord v;
  v.id             = ColI64(st, 0);
  v.session_id     = ColText(st, 1);
  v.participant_id = ColText(st, 2);
  v.kind           = liveviewer::model::ParticipantKindFromStorage(sqlite3_column_int(st, 3)).value_or(ParticipantKind::kExternal);
  v.display_name   = ColText(st, 4);

  v.watch_seconds    = ColI64(st, 5);
  v.watch_percentage = sqlite3_column_double(st, 6);
  v.commented        = ColBool(st, 7);
  v.used_mic         = ColBool(st, 8);

  v.signed_in         = ColBool(st, 9);
  v.last_sign_time_ms = ColOptU64(st, 10);
  v.sign_count        = ColI64(st, 11);

  v.inviter_id = ColOptText(st, 12);
  if (sqlite3_column_type(st, 13) != SQLITE_NULL) {
    v.inviter_kind = liveviewer::model::ParticipantKindFromStorage(sqlite3_column_int(st, 13));
  }
  v.inviter_name    = ColOptText(st, 14);
  v.invited_by_host = ColBool(st, 15);

  v.reward_eligible = ColBool(st, 16);
  v.reward_amount   = sqlite3_column_double(st, 17);
  v.reward_status   = ColText(st, 18);

  v.created_at_ms = ColU64(st, 19);
  v.updated_at_ms = ColU64(st, 20);

  v.first_enter_time_ms = ColOptU64(st, 21);
  v.last_leave_time_ms  = ColOptU64(st, 22);
  v.comment_count       = ColI64(st, 23);
  v.mic_seconds         = ColI64(st, 24);
  return v;
}

model::RewardRecord ReadReward(sqlite3_stmt* st) {
  model::RewardRecord r;
  r.id               = ColI64(st, 0);
  r.session_id       = ColText(st, 1);
  r.viewer_record_id = ColI64(st, 2);

  const auto wire = ColText(st, 3);
  const auto type = liveviewer::model::ParseRewardRuleType(wire);
  if (!type) {
    throw util::PersistenceError("reward row " + std::to_string(r.id) + " has unknown rule type '" + wire + "'");
  }
  r.rule_type = *type;

  r.rule_sign_count      = ColI64(st, 4);
  r.rule_watch_seconds   = ColI64(st, 5);
  r.rule_watch_count     = ColI64(st, 6);
  r.calculation_batch_id = ColText(st, 7);
  r.reward_amount        = sqlite3_column_double(st, 8);
  r.eligible             = ColBool(st, 9);
  r.created_at_ms        = ColU64(st, 10);
  r.updated_at_ms        = ColU64(st, 11);
  return r;
}

// Binds the viewer body shared by INSERT_VIEWER and UPDATE_VIEWER; returns the next index.
int BindViewerBody(sqlite3_stmt* st, const model::ViewerRecord& v) {
  int i = 1;
  BindText(st, i++, v.session_id);
  BindText(st, i++, v.participant_id);
  sqlite3_bind_int(st, i++, liveviewer::model::ToStorage(v.kind));
  BindText(st, i++, v.display_name);
  BindI64(st, i++, v.watch_seconds);
  BindDouble(st, i++, v.watch_percentage);
  BindBool(st, i++, v.commented);
  BindBool(st, i++, v.used_mic);
  BindBool(st, i++, v.signed_in);
  BindOptU64(st, i++, v.last_sign_time_ms);
  BindI64(st, i++, v.sign_count);
  BindOptText(st, i++, v.inviter_id);
  BindOptKind(st, i++, v.inviter_kind);
  BindOptText(st, i++, v.inviter_name);
  BindBool(st, i++, v.invited_by_host);
  BindBool(st, i++, v.reward_eligible);
  BindDouble(st, i++, v.reward_amount);
  BindText(st, i++, v.reward_status);
  BindOptU64(st, i++, v.first_enter_time_ms);
  BindOptU64(st, i++, v.last_leave_time_ms);
  BindI64(st, i++, v.comment_count);
  BindI64(st, i++, v.mic_seconds);
  return i;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire());
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSession(Transaction& t, model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::UPSERT_SESSION);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.Get(), 1, r.session_id);
  BindText(st.Get(), 2, r.theme);
  BindText(st.Get(), 3, r.host_id);
  BindText(st.Get(), 4, r.host_name);
  BindU64(st.Get(), 5, r.start_time_ms);
  BindI64(st.Get(), 6, r.duration_seconds);

  int rc = sqlite3_step(st.Get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  Stmt id_st(db, sql::SELECT_SESSION_ID);
  if (!id_st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(id_st.Get(), 1, r.session_id);
  if (sqlite3_step(id_st.Get()) == SQLITE_ROW) r.id = ColI64(id_st.Get(), 0);
  return Result::Ok();
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::SELECT_SESSION);
  if (!st.Ok()) return std::nullopt;

  BindText(st.Get(), 1, session_id);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;

  model::SessionRecord r;
  r.id               = ColI64(st.Get(), 0);
  r.session_id       = ColText(st.Get(), 1);
  r.theme            = ColText(st.Get(), 2);
  r.host_id          = ColText(st.Get(), 3);
  r.host_name        = ColText(st.Get(), 4);
  r.start_time_ms    = ColU64(st.Get(), 5);
  r.duration_seconds = ColI64(st.Get(), 6);
  return r;
}

// ------------------------------------------------------------------
// Viewers
// ------------------------------------------------------------------

Result SqliteRepository::InsertViewers(Transaction& t, std::vector<model::ViewerRecord>& viewers) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::INSERT_VIEWER);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto now = util::NowMillis();
  for (auto& v : viewers) {
    if (v.created_at_ms == 0) v.created_at_ms = now;
    v.updated_at_ms = now;

    sqlite3_reset(st.Get());
    sqlite3_clear_bindings(st.Get());
    int i = BindViewerBody(st.Get(), v);
    BindU64(st.Get(), i++, v.created_at_ms);
    BindU64(st.Get(), i++, v.updated_at_ms);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    v.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  }
  return Result::Ok();
}

Result SqliteRepository::UpdateViewers(Transaction& t, const std::vector<model::ViewerRecord>& viewers) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::UPDATE_VIEWER);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto now = util::NowMillis();
  for (const auto& v : viewers) {
    sqlite3_reset(st.Get());
    sqlite3_clear_bindings(st.Get());
    int i = BindViewerBody(st.Get(), v);
    BindU64(st.Get(), i++, now);
    BindI64(st.Get(), i++, v.id);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "viewer " + std::to_string(v.id));
  }
  return Result::Ok();
}

std::vector<model::ViewerRecord> SqliteRepository::ListViewersBySession(Transaction& t, const std::string& session_id) {
  return ListViewersBySessions(t, {session_id});
}

std::vector<model::ViewerRecord> SqliteRepository::ListViewersBySessions(Transaction&                    t,
                                                                         const std::vector<std::string>& session_ids) {
  auto* db = TX(t).Handle();

  std::vector<model::ViewerRecord> out;
  for (const auto& chunk : Chunk(session_ids, kMaxInList)) {
    const std::string query = std::string("SELECT ") + sql::VIEWER_COLUMNS +
                              " FROM live_viewers WHERE session_id IN (" + Placeholders(chunk.size()) + ") ORDER BY id;";
    Stmt st(db, query);
    if (!st.Ok()) return {};

    for (std::size_t i = 0; i < chunk.size(); ++i) BindText(st.Get(), static_cast<int>(i) + 1, chunk[i]);
    while (sqlite3_step(st.Get()) == SQLITE_ROW) out.push_back(ReadViewer(st.Get()));
  }
  return out;
}

std::unordered_map<std::string, int64_t> SqliteRepository::FindViewerIds(
    Transaction& t, const std::vector<liveviewer::model::ViewerKey>& keys) {
  auto* db = TX(t).Handle();

  // group by (session, kind) so each query filters on an indexed prefix
  std::map<std::pair<std::string, int>, std::vector<std::string>> groups;
  for (const auto& key : keys) {
    groups[{key.session_id, liveviewer::model::ToStorage(key.kind)}].push_back(key.participant_id);
  }

  std::unordered_map<std::string, int64_t> out;
  for (const auto& [group, participants] : groups) {
    const auto kind = liveviewer::model::ParticipantKindFromStorage(group.second).value_or(ParticipantKind::kExternal);
    for (const auto& chunk : Chunk(participants, kMaxInList)) {
      const std::string query =
          "SELECT id,participant_id FROM live_viewers WHERE session_id=? AND kind=? AND participant_id IN (" +
          Placeholders(chunk.size()) + ");";
      Stmt st(db, query);
      if (!st.Ok()) return out;

      BindText(st.Get(), 1, group.first);
      sqlite3_bind_int(st.Get(), 2, group.second);
      for (std::size_t i = 0; i < chunk.size(); ++i) BindText(st.Get(), static_cast<int>(i) + 3, chunk[i]);

      while (sqlite3_step(st.Get()) == SQLITE_ROW) {
        liveviewer::model::ViewerKey key{group.first, kind, ColText(st.Get(), 1)};
        out[key.ToString()] = ColI64(st.Get(), 0);
      }
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> SqliteRepository::FindParticipantNames(
    Transaction& t, const std::string& session_id, const std::vector<std::string>& participant_ids) {
  auto* db = TX(t).Handle();

  std::unordered_map<std::string, std::string> out;
  for (const auto& chunk : Chunk(participant_ids, kMaxInList)) {
    const std::string query =
        "SELECT participant_id,display_name FROM live_viewers WHERE session_id=? AND display_name<>''"
        " AND participant_id IN (" + Placeholders(chunk.size()) + ");";
    Stmt st(db, query);
    if (!st.Ok()) return out;

    BindText(st.Get(), 1, session_id);
    for (std::size_t i = 0; i < chunk.size(); ++i) BindText(st.Get(), static_cast<int>(i) + 2, chunk[i]);
    while (sqlite3_step(st.Get()) == SQLITE_ROW) out[ColText(st.Get(), 0)] = ColText(st.Get(), 1);
  }
  return out;
}

std::optional<std::string> SqliteRepository::FindAnyParticipantName(Transaction& t, const std::string& participant_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::SELECT_ANY_PARTICIPANT_NAME);
  if (!st.Ok()) return std::nullopt;

  BindText(st.Get(), 1, participant_id);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
  return ColText(st.Get(), 0);
}

Result SqliteRepository::UpdateInvitations(Transaction& t, const std::vector<model::InvitationUpdate>& updates) {
  auto* db = TX(t).Handle();

  const auto now = util::NowMillis();
  for (const auto& chunk : Chunk(updates, kMaxUpdateRows)) {
    std::string values;
    values.reserve(chunk.size() * 10);
    for (std::size_t i = 0; i < chunk.size(); ++i) {
      if (i) values += ',';
      values += "(?,?,?)";
    }

    // one statement per chunk
    const std::string query =
        "WITH v(id,name,host) AS (VALUES " + values + ") "
        "UPDATE live_viewers SET "
        "inviter_name=(SELECT name FROM v WHERE v.id=live_viewers.id),"
        "invited_by_host=(SELECT host FROM v WHERE v.id=live_viewers.id),"
        "updated_at_ms=? "
        "WHERE id IN (SELECT id FROM v);";

    Stmt st(db, query);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int idx = 1;
    for (const auto& u : chunk) {
      BindI64(st.Get(), idx++, u.viewer_id);
      BindText(st.Get(), idx++, u.inviter_name);
      BindBool(st.Get(), idx++, u.invited_by_host);
    }
    BindU64(st.Get(), idx, now);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

Result SqliteRepository::UpdateRewardSummaries(Transaction& t, const std::vector<model::RewardSummaryUpdate>& updates) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::UPDATE_REWARD_SUMMARY);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto now = util::NowMillis();
  for (const auto& u : updates) {
    sqlite3_reset(st.Get());
    BindBool(st.Get(), 1, u.reward_eligible);
    BindDouble(st.Get(), 2, u.reward_amount);
    BindText(st.Get(), 3, u.reward_status);
    BindU64(st.Get(), 4, now);
    BindI64(st.Get(), 5, u.viewer_id);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

Result SqliteRepository::UpdateSignSummaries(Transaction& t, const std::vector<model::SignSummaryUpdate>& updates) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::UPDATE_SIGN_SUMMARY);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto now = util::NowMillis();
  for (const auto& u : updates) {
    sqlite3_reset(st.Get());
    sqlite3_clear_bindings(st.Get());
    BindBool(st.Get(), 1, u.signed_in);
    BindOptU64(st.Get(), 2, u.last_sign_time_ms);
    BindI64(st.Get(), 3, u.sign_count);
    BindU64(st.Get(), 4, now);
    BindI64(st.Get(), 5, u.viewer_id);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sign-in details
// ------------------------------------------------------------------

Result SqliteRepository::InsertSignRecords(Transaction& t, std::vector<model::SignRecord>& records) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::INSERT_SIGN_RECORD);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (auto& r : records) {
    sqlite3_reset(st.Get());
    BindText(st.Get(), 1, r.session_id);
    BindI64(st.Get(), 2, r.viewer_record_id);
    BindU64(st.Get(), 3, r.sign_time_ms);
    BindText(st.Get(), 4, r.sign_type);
    sqlite3_bind_int(st.Get(), 5, r.sequence);
    BindBool(st.Get(), 6, r.valid);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  }
  return Result::Ok();
}

std::unordered_map<int64_t, model::SignAggregate> SqliteRepository::AggregateSignRecords(
    Transaction& t, const std::vector<std::string>& session_ids) {
  auto* db = TX(t).Handle();

  std::unordered_map<int64_t, model::SignAggregate> out;
  for (const auto& chunk : Chunk(session_ids, kMaxInList)) {
    const std::string query =
        "SELECT viewer_record_id,COUNT(*),MAX(sign_time_ms) FROM live_sign_records"
        " WHERE valid=1 AND session_id IN (" + Placeholders(chunk.size()) + ") GROUP BY viewer_record_id;";
    Stmt st(db, query);
    if (!st.Ok()) return out;

    for (std::size_t i = 0; i < chunk.size(); ++i) BindText(st.Get(), static_cast<int>(i) + 1, chunk[i]);
    while (sqlite3_step(st.Get()) == SQLITE_ROW) {
      auto& agg = out[ColI64(st.Get(), 0)];
      agg.count += ColI64(st.Get(), 1);
      agg.last_sign_time_ms = std::max(agg.last_sign_time_ms, ColU64(st.Get(), 2));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Rewards
// ------------------------------------------------------------------

Result SqliteRepository::DeleteRewardsBySessions(Transaction& t, const std::vector<std::string>& session_ids) {
  auto* db = TX(t).Handle();

  for (const auto& chunk : Chunk(session_ids, kMaxInList)) {
    const std::string query = "DELETE FROM live_reward_records WHERE session_id IN (" + Placeholders(chunk.size()) + ");";
    Stmt              st(db, query);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (std::size_t i = 0; i < chunk.size(); ++i) BindText(st.Get(), static_cast<int>(i) + 1, chunk[i]);
    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

Result SqliteRepository::InsertRewards(Transaction& t, std::vector<model::RewardRecord>& rewards) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::INSERT_REWARD);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto now = util::NowMillis();
  for (auto& r : rewards) {
    if (r.created_at_ms == 0) r.created_at_ms = now;
    r.updated_at_ms = now;

    sqlite3_reset(st.Get());
    BindText(st.Get(), 1, r.session_id);
    BindI64(st.Get(), 2, r.viewer_record_id);
    BindText(st.Get(), 3, std::string(liveviewer::model::ToWire(r.rule_type)));
    BindI64(st.Get(), 4, r.rule_sign_count);
    BindI64(st.Get(), 5, r.rule_watch_seconds);
    BindI64(st.Get(), 6, r.rule_watch_count);
    BindText(st.Get(), 7, r.calculation_batch_id);
    BindDouble(st.Get(), 8, r.reward_amount);
    BindBool(st.Get(), 9, r.eligible);
    BindU64(st.Get(), 10, r.created_at_ms);
    BindU64(st.Get(), 11, r.updated_at_ms);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  }
  return Result::Ok();
}

std::vector<model::RewardRecord> SqliteRepository::ListRewardsBySession(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  const std::string query = std::string("SELECT ") + sql::REWARD_COLUMNS +
                            " FROM live_reward_records WHERE session_id=? ORDER BY id;";
  Stmt st(db, query);
  if (!st.Ok()) return {};

  BindText(st.Get(), 1, session_id);
  std::vector<model::RewardRecord> out;
  while (sqlite3_step(st.Get()) == SQLITE_ROW) out.push_back(ReadReward(st.Get()));
  return out;
}

std::vector<model::RewardRecord> SqliteRepository::SampleRewardsBySession(Transaction& t, const std::string& session_id,
                                                                          std::size_t limit) {
  auto* db = TX(t).Handle();

  const std::string query = std::string("SELECT ") + sql::REWARD_COLUMNS +
                            " FROM live_reward_records WHERE session_id=? ORDER BY id LIMIT ?;";
  Stmt st(db, query);
  if (!st.Ok()) return {};

  BindText(st.Get(), 1, session_id);
  BindU64(st.Get(), 2, limit);
  std::vector<model::RewardRecord> out;
  while (sqlite3_step(st.Get()) == SQLITE_ROW) out.push_back(ReadReward(st.Get()));
  return out;
}

// ------------------------------------------------------------------
// Inviter name cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertInviterNames(Transaction& t, const std::vector<model::InviterCacheRecord>& records) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::UPSERT_INVITER_NAME);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto now = util::NowMillis();
  for (const auto& r : records) {
    sqlite3_reset(st.Get());
    BindText(st.Get(), 1, r.inviter_id);
    BindText(st.Get(), 2, r.name);
    BindU64(st.Get(), 3, now);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

std::vector<model::InviterCacheRecord> SqliteRepository::ListInviterNames(Transaction& t) {
  auto* db = TX(t).Handle();

  Stmt st(db, sql::SELECT_INVITER_NAMES);
  if (!st.Ok()) return {};

  std::vector<model::InviterCacheRecord> out;
  while (sqlite3_step(st.Get()) == SQLITE_ROW) {
    model::InviterCacheRecord r;
    r.inviter_id    = ColText(st.Get(), 0);
    r.name          = ColText(st.Get(), 1);
    r.updated_at_ms = ColU64(st.Get(), 2);
    out.push_back(std::move(r));
  }
  return out;
}

std::unordered_map<std::string, std::string> SqliteRepository::FindInviterNames(Transaction&                    t,
                                                                                 const std::vector<std::string>& inviter_ids) {
  auto* db = TX(t).Handle();

  std::unordered_map<std::string, std::string> out;
  for (const auto& chunk : Chunk(inviter_ids, kMaxInList)) {
    const std::string query =
        "SELECT inviter_id,name FROM inviter_cache WHERE inviter_id IN (" + Placeholders(chunk.size()) + ");";
    Stmt st(db, query);
    if (!st.Ok()) return out;

    for (std::size_t i = 0; i < chunk.size(); ++i) BindText(st.Get(), static_cast<int>(i) + 1, chunk[i]);
    while (sqlite3_step(st.Get()) == SQLITE_ROW) out[ColText(st.Get(), 0)] = ColText(st.Get(), 1);
  }
  return out;
}

} // namespace liveviewer::db::sqlite
