#pragma once

#include <string>
#include <vector>

namespace liveviewer::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied migration version, 0 when none.
  virtual int  CurrentVersion()           = 0;
  virtual void RecordVersion(int version) = 0;
};

/*
  Runs migrations in order; migration N is ordered_sql[N - 1].
  Already-applied versions are skipped.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema of the live viewer store, in migration order.
const std::vector<std::string>& ViewerStoreMigrations();

} // namespace liveviewer::db::sql
