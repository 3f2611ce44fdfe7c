#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/platform/replay_platform_api.hpp"
#if LIVEVIEWER_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace liveviewer::factory {

std::shared_ptr<db::Repository> BuildRepository(const liveviewer::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LIVEVIEWER_DB_SQLITE
    auto pool = std::make_shared<db::sqlite::SqlitePool>(database.sqlite().path(), database.sqlite().pool_size());
    {
      auto conn = pool->Acquire();
      db::sqlite::BootstrapSqliteSchema(*conn);
    }
    LIVEVIEWER_LOG_INFO("sqlite store ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

ingest::IngestionOptions BuildIngestionOptions(const liveviewer::runtime::config::RuntimeConfig& config) {
  const auto& in = config.ingestion();

  ingest::IngestionOptions options;
  if (in.queue_capacity()) options.queue_capacity = in.queue_capacity();
  if (in.batch_size()) options.batch_size = in.batch_size();
  if (in.pause_every_pages()) options.pause_every_pages = in.pause_every_pages();
  if (in.page_pause_ms()) options.page_pause = std::chrono::milliseconds(in.page_pause_ms());
  options.run_timeout = std::chrono::seconds(in.run_timeout_sec());
  return options;
}

Application Build(const liveviewer::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<platform::LivePlatformApi>        platform) {
  Application app;
  app.repository = BuildRepository(config);
  app.rewards    = std::make_shared<reward::RewardRuleEngine>(app.repository);

  if (!platform && !config.platform().replay_dir().empty()) {
    platform = std::make_shared<platform::ReplayPlatformApi>(config.platform().replay_dir());
  }

  app.platform  = platform;
  app.ingestion = std::make_shared<ingest::ViewerIngestion>(app.repository, platform, BuildIngestionOptions(config));
  return app;
}

} // namespace liveviewer::factory
