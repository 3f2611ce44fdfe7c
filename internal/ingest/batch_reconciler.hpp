#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/participant.hpp"
#include "paginated_collector.hpp"

namespace liveviewer::ingest {

// Inviter that could not be named while streaming; settled by the backfill.
struct UnresolvedInvitation {
  liveviewer::model::ViewerKey       viewer;
  std::string                        inviter_id;
  liveviewer::model::ParticipantKind inviter_kind = liveviewer::model::ParticipantKind::kInternal;
};

// Keyed by ViewerKey::ToString().
using UnresolvedInvitations = std::unordered_map<std::string, UnresolvedInvitation>;

// Existing rows of one kind for the session, keyed by participant id.
using ExistingPartition = std::unordered_map<std::string, db::model::ViewerRecord>;

struct ReconcileResult {
  liveviewer::model::ParticipantKind kind = liveviewer::model::ParticipantKind::kInternal;

  std::size_t processed = 0;
  std::size_t created   = 0;
  std::size_t updated   = 0;
  std::size_t errors    = 0;

  UnresolvedInvitations unresolved;

  bool        failed = false;
  std::string error;
};

struct ReconcilerOptions {
  std::size_t batch_size       = 1000;
  int64_t     session_duration = 0; // seconds, for watch percentage
};

/*
  Consumer side of an ingestion run, one per participant kind.

  Each sighting becomes a pending create or merges into a pending update
  of an indexed row. Pending batches are flushed at batch_size and at end
  of stream, each flush in its own transaction. A failed flush stops the
  reconciler and abandons its queue; earlier flushes stay committed.
*/
class BatchReconciler {
 public:
  BatchReconciler(liveviewer::model::ParticipantKind kind, std::string session_id,
                  std::shared_ptr<db::Repository> repo, IdentityCache& identities, SightingQueue& queue,
                  ExistingPartition existing, const RunContext& ctx, ReconcilerOptions options = {});

  ReconcileResult Reconcile();

 private:
  void Apply(const platform::ParticipantSighting& s, ReconcileResult& result);
  void MergeInto(db::model::ViewerRecord& row, const platform::ParticipantSighting& s, ReconcileResult& result);

  bool FlushCreates(ReconcileResult& result);
  bool FlushUpdates(ReconcileResult& result);
  void Fail(ReconcileResult& result, const std::string& error);

  double WatchPercentage(int64_t watch_seconds) const;

  const liveviewer::model::ParticipantKind kind_;
  const std::string                        session_id_;
  std::shared_ptr<db::Repository>          repo_;
  IdentityCache&                           identities_;
  SightingQueue&                           queue_;
  ExistingPartition                        index_;
  const RunContext&                        ctx_;
  ReconcilerOptions                        options_;

  // participant id -> pending new row, in arrival order
  std::unordered_map<std::string, db::model::ViewerRecord> pending_creates_;
  std::vector<std::string>                                 create_order_;

  // participant ids whose indexed row changed since the last flush
  std::vector<std::string>        pending_updates_;
  std::unordered_set<std::string> update_marked_;
};

} // namespace liveviewer::ingest
