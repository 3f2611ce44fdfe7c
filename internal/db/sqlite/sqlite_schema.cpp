#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace liveviewer::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
    db_.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version),0) FROM schema_migrations;");
    int           version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return version;
  }

  void RecordVersion(int version) override {
    db_.Exec("INSERT INTO schema_migrations(version,applied_at_ms) VALUES(" + std::to_string(version) + "," +
             std::to_string(util::NowMillis()) + ");");
  }

 private:
  SqliteDB& db_;
};

} // namespace

void BootstrapSqliteSchema(SqliteDB& db) {
  SqliteMigrationExecutor executor(db);
  sql::RunMigrations(executor, sql::ViewerStoreMigrations());
}

} // namespace liveviewer::db::sqlite
