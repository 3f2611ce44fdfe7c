#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace liveviewer::db::sqlite {

// One open connection to the viewer store file.
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Throws PersistenceError on failure.
  void Exec(const std::string& sql);

  // Caller finalizes.
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL journal, busy_timeout and foreign key enforcement.
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace liveviewer::db::sqlite
