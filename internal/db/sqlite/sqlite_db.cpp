#include "sqlite_db.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace liveviewer::db::sqlite {

namespace {

void Check(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) throw util::PersistenceError(what + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  // a connection is leased to one thread at a time
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::PersistenceError("open viewer store " + path_ + ": " + reason);
  }

  try {
    Configure();
  } catch (const util::PersistenceError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw util::PersistenceError(reason);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  Check(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // readers of one session keep going while another session's pages commit
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Check(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

} // namespace liveviewer::db::sqlite
