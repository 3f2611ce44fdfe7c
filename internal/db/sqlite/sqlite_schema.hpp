#pragma once

#include "sqlite_db.hpp"

namespace liveviewer::db::sqlite {

// Applies pending viewer store migrations on one connection.
void BootstrapSqliteSchema(SqliteDB& db);

} // namespace liveviewer::db::sqlite
