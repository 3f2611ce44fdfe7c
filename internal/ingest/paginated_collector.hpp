#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "bounded_queue.hpp"
#include "identity_cache.hpp"
#include "internal/platform/payload_normalizer.hpp"
#include "run_context.hpp"

namespace liveviewer::platform {
class LivePlatformApi;
}

namespace liveviewer::ingest {

using SightingQueue = BoundedQueue<platform::ParticipantSighting>;

struct CollectorOptions {
  // Sleep page_pause after every pause_every_pages pages (0 disables).
  std::size_t               pause_every_pages = 5;
  std::chrono::milliseconds page_pause{500};
};

struct CollectionStats {
  std::size_t pages           = 0;
  std::size_t internal_queued = 0;
  std::size_t external_queued = 0;
  std::size_t malformed       = 0;
  // rejected by a closed or abandoned queue
  std::size_t dropped = 0;

  bool partial   = false;
  bool fatal     = false;
  bool cancelled = false;

  std::string last_error;
};

/*
  Producer side of an ingestion run.

  Pages through the statistics endpoint, normalizes each page, registers
  page names with the identity cache and publishes sightings to the
  queue of their kind. Both queues are closed on every exit path.

  A failure on the first page is fatal; a later failure stops paging and
  marks the run partial, keeping what was already queued.
*/
class PaginatedCollector {
 public:
  PaginatedCollector(std::shared_ptr<platform::LivePlatformApi> api, IdentityCache& identities,
                     SightingQueue& internal, SightingQueue& external, const RunContext& ctx,
                     CollectorOptions options = {});

  CollectionStats Collect(const std::string& session_id);

 private:
  void Publish(platform::NormalizedPage& page, CollectionStats& stats);
  bool Pause();

  std::shared_ptr<platform::LivePlatformApi> api_;
  IdentityCache&                             identities_;
  SightingQueue&                             internal_;
  SightingQueue&                             external_;
  const RunContext&                          ctx_;
  CollectorOptions                           options_;
};

} // namespace liveviewer::ingest
