#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "batch_reconciler.hpp"
#include "paginated_collector.hpp"
#include "run_context.hpp"

namespace liveviewer::platform {
class LivePlatformApi;
}

namespace liveviewer::ingest {

struct IngestionOptions {
  std::size_t               queue_capacity    = 2000;
  std::size_t               batch_size        = 1000;
  std::size_t               pause_every_pages = 5;
  std::chrono::milliseconds page_pause{500};
  // zero: no deadline
  std::chrono::milliseconds run_timeout{0};
};

struct ViewerStats {
  std::size_t total_viewers       = 0;
  std::size_t internal_viewers    = 0;
  std::size_t external_viewers    = 0;
  std::size_t success_count       = 0;
  std::size_t error_count         = 0;
  int64_t     total_watch_seconds = 0;

  std::string last_error;
  uint64_t    last_error_time_ms = 0;
  uint64_t    last_sync_time_ms  = 0;
};

struct IngestionOutcome {
  bool        success = false;
  bool        partial = false;
  std::string message;
  ViewerStats stats;

  CollectionStats collection;
  ReconcileResult internal;
  ReconcileResult external;
  std::size_t     backfilled = 0;
};

struct SignSyncResult {
  bool        success = false;
  std::size_t updated = 0;
  std::size_t errors  = 0;
  std::string message;
};

struct SessionViewerStatistics {
  std::size_t total_viewers    = 0;
  std::size_t internal_viewers = 0;
  std::size_t external_viewers = 0;

  int64_t total_watch_seconds      = 0;
  double  average_watch_seconds    = 0.0;
  double  average_watch_percentage = 0.0;

  std::size_t comment_count   = 0; // viewers who commented
  std::size_t mic_count       = 0; // viewers who used the mic
  int64_t     total_comments    = 0;
  int64_t     total_mic_seconds = 0;
  std::size_t signed_in_count = 0;
  double      sign_rate       = 0.0; // percent of viewers

  std::size_t invited_count         = 0;
  std::size_t invited_by_host_count = 0;
};

/*
  Upstream entry point for viewer data of one session.

  ProcessViewerInfo owns a single run: preload, collector plus two
  reconcilers on a worker group, invitation backfill, inviter cache
  write-back and statistics. Exceptions never escape; failures are
  reported in the outcome.

  One run at a time per instance.
*/
class ViewerIngestion {
 public:
  ViewerIngestion(std::shared_ptr<db::Repository> repo, std::shared_ptr<platform::LivePlatformApi> api,
                  IngestionOptions options = {});

  IngestionOutcome ProcessViewerInfo(const std::string& session_id);

  // Copies valid sign-in records into the viewer rows of a session.
  SignSyncResult SyncSignInfo(const std::string& session_id);

  // Throws util::NotFound for an unknown session.
  SessionViewerStatistics GetViewerStatistics(const std::string& session_id);

  ViewerStats LastStats() const;

  // Cancels the run in progress, if any.
  void Cancel();

 private:
  void Run(const std::string& session_id, IngestionOutcome& outcome);
  void             PersistRemoteNames(const IdentityCache& identities);
  void             RecordError(IngestionOutcome& outcome, const std::string& error);

  std::shared_ptr<db::Repository>            repo_;
  std::shared_ptr<platform::LivePlatformApi> api_;
  IngestionOptions                           options_;

  std::mutex                  run_mutex_;
  mutable std::mutex          state_mutex_;
  ViewerStats                 last_stats_;
  std::shared_ptr<RunContext> current_;
};

} // namespace liveviewer::ingest
