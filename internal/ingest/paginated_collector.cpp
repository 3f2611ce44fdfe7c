#include "paginated_collector.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/platform/live_platform_api.hpp"

namespace liveviewer::ingest {

using observability::IntField;
using observability::StringField;

namespace {

// Closes both queues when the collector leaves, whichever way it leaves.
class QueueCloser {
 public:
  QueueCloser(SightingQueue& a, SightingQueue& b) : a_(a), b_(b) {
  }
  ~QueueCloser() {
    a_.Close();
    b_.Close();
  }

 private:
  SightingQueue& a_;
  SightingQueue& b_;
};

constexpr std::chrono::milliseconds kPauseSlice{50};

} // namespace

PaginatedCollector::PaginatedCollector(std::shared_ptr<platform::LivePlatformApi> api, IdentityCache& identities,
                                       SightingQueue& internal, SightingQueue& external, const RunContext& ctx,
                                       CollectorOptions options)
    : api_(std::move(api)),
      identities_(identities),
      internal_(internal),
      external_(external),
      ctx_(ctx),
      options_(options) {
}

CollectionStats PaginatedCollector::Collect(const std::string& session_id) {
  QueueCloser closer(internal_, external_);

  CollectionStats stats;
  std::string     cursor;

  for (;;) {
    if (ctx_.Cancelled()) {
      stats.cancelled  = true;
      stats.partial    = stats.pages > 0;
      stats.fatal      = stats.pages == 0;
      stats.last_error = ctx_.Expired() ? "run deadline exceeded" : "run cancelled";
      break;
    }

    platform::wire::WatchStatResponse response;
    std::string                       error;
    try {
      response = api_->GetWatchStatistics(session_id, cursor);
      if (response.errcode() != 0) {
        error = "errcode " + std::to_string(response.errcode()) + ": " + response.errmsg();
      }
    } catch (const platform::ApiError& e) {
      error = e.what();
    }

    if (!error.empty()) {
      stats.last_error = error;
      if (stats.pages == 0) {
        stats.fatal = true;
        LIVEVIEWER_LOG_ERROR("first statistics page failed",
                             {StringField("session", session_id), StringField("error", error)});
      } else {
        stats.partial = true;
        LIVEVIEWER_LOG_WARN("statistics paging stopped early",
                            {StringField("session", session_id), IntField("page", static_cast<int64_t>(stats.pages + 1)),
                             StringField("error", error)});
      }
      break;
    }

    ++stats.pages;
    auto page = platform::NormalizePage(response);
    Publish(page, stats);

    LIVEVIEWER_LOG_DEBUG("statistics page collected",
                         {StringField("session", session_id), IntField("page", static_cast<int64_t>(stats.pages)),
                          IntField("internal", static_cast<int64_t>(page.internal.size())),
                          IntField("external", static_cast<int64_t>(page.external.size()))});

    if (response.ending() == 1 || response.next_key().empty()) break;

    if (response.next_key() == cursor) {
      stats.partial    = true;
      stats.last_error = "cursor did not advance";
      LIVEVIEWER_LOG_WARN("statistics cursor repeated", {StringField("session", session_id), StringField("cursor", cursor)});
      break;
    }
    cursor = response.next_key();

    if (options_.pause_every_pages > 0 && stats.pages % options_.pause_every_pages == 0 && !Pause()) {
      continue; // cancellation is reported at the top of the loop
    }
  }

  LIVEVIEWER_LOG_INFO("statistics collection finished",
                      {StringField("session", session_id), IntField("pages", static_cast<int64_t>(stats.pages)),
                       IntField("internal_queued", static_cast<int64_t>(stats.internal_queued)),
                       IntField("external_queued", static_cast<int64_t>(stats.external_queued)),
                       IntField("malformed", static_cast<int64_t>(stats.malformed)),
                       IntField("dropped", static_cast<int64_t>(stats.dropped)),
                       observability::BoolField("partial", stats.partial)});
  return stats;
}

void PaginatedCollector::Publish(platform::NormalizedPage& page, CollectionStats& stats) {
  stats.malformed += page.malformed;
  identities_.AddPageHints(page.name_hints);

  for (auto& s : page.internal) {
    if (internal_.Push(std::move(s))) {
      ++stats.internal_queued;
    } else {
      ++stats.dropped;
    }
  }
  for (auto& s : page.external) {
    if (external_.Push(std::move(s))) {
      ++stats.external_queued;
    } else {
      ++stats.dropped;
    }
  }
}

// false when the run was cancelled during the pause
bool PaginatedCollector::Pause() {
  auto remaining = options_.page_pause;
  while (remaining.count() > 0) {
    if (ctx_.Cancelled()) return false;
    const auto slice = std::min(remaining, kPauseSlice);
    std::this_thread::sleep_for(slice);
    remaining -= slice;
  }
  return !ctx_.Cancelled();
}

} // namespace liveviewer::ingest
