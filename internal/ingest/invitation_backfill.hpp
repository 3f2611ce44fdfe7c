#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "batch_reconciler.hpp"

namespace liveviewer::ingest {

// Rows per multi-row invitation update.
inline constexpr std::size_t kBackfillChunkRows = 1000;

/*
  Second pass over invitations the reconcilers could not name.

  Inviter names come from the identity cache (host, preload, page hints
  and this run's remote lookups), then one batched query over this
  session's viewers and the inviter cache, then a per-id lookup across
  all sessions. Viewer rows are resolved in one query and updated in
  chunks, all inside one transaction. Inviters still unnamed keep the
  raw id written while streaming.

  Throws util::PersistenceError when the store rejects the update.
*/
class InvitationBackfill {
 public:
  InvitationBackfill(std::shared_ptr<db::Repository> repo, const IdentityCache& identities, std::string session_id);

  std::size_t Backfill(const UnresolvedInvitations& unresolved);

 private:
  std::shared_ptr<db::Repository> repo_;
  const IdentityCache&            identities_;
  const std::string               session_id_;
};

} // namespace liveviewer::ingest
