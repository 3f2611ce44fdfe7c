#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/viewer_ingestion.hpp"
#include "internal/platform/live_platform_api.hpp"
#include "internal/reward/reward_rule_engine.hpp"

namespace liveviewer::factory {

/*
  Application

  Owns the long-lived components of one process.
  platform is null when no platform source is configured; ingestion
  then serves only store-side operations.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<platform::LivePlatformApi>   platform;
  std::shared_ptr<ingest::ViewerIngestion>     ingestion;
  std::shared_ptr<reward::RewardRuleEngine>    rewards;
};

/*
  Build

  Composition root: the ONLY place allowed to know concrete store and
  platform types. A caller-supplied platform overrides platform.replay_dir.
*/
Application Build(const liveviewer::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<platform::LivePlatformApi>  platform = nullptr);

std::shared_ptr<db::Repository> BuildRepository(const liveviewer::runtime::config::RuntimeConfig& config);

ingest::IngestionOptions BuildIngestionOptions(const liveviewer::runtime::config::RuntimeConfig& config);

} // namespace liveviewer::factory
