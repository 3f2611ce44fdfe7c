#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace liveviewer::db::sqlite {

/*
  SqlitePool

  Connection pool used by SqliteRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection; a connection is never
    used by two threads at once.
  - Connections are opened lazily up to max_connections and returned
    to the idle list when the last shared_ptr drops.
  - The database must be a file: every ":memory:" connection would
    open a separate database.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction holds shared_ptr<SqliteDB>
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  explicit SqlitePool(std::string path, std::size_t max_connections = 4);

  // Acquire a ready-to-use connection, blocking while all are leased
  std::shared_ptr<SqliteDB> Acquire();

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string path_;
  std::size_t max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace liveviewer::db::sqlite
