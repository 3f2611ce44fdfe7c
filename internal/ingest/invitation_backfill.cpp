#include "invitation_backfill.hpp"

#include <algorithm>
#include <utility>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace liveviewer::ingest {

using observability::IntField;
using observability::StringField;

InvitationBackfill::InvitationBackfill(std::shared_ptr<db::Repository> repo, const IdentityCache& identities,
                                       std::string session_id)
    : repo_(std::move(repo)), identities_(identities), session_id_(std::move(session_id)) {
}

std::size_t InvitationBackfill::Backfill(const UnresolvedInvitations& unresolved) {
  if (unresolved.empty()) return 0;

  std::vector<std::string>        inviter_ids;
  std::unordered_set<std::string> seen;
  std::vector<liveviewer::model::ViewerKey> viewers;
  viewers.reserve(unresolved.size());
  for (const auto& [_, u] : unresolved) {
    viewers.push_back(u.viewer);
    if (seen.insert(u.inviter_id).second) inviter_ids.push_back(u.inviter_id);
  }

  auto tx = repo_->Begin();

  // inviter id -> name
  std::unordered_map<std::string, std::string> names;
  std::vector<std::string>                     pending;
  for (const auto& id : inviter_ids) {
    // names learned after the row was streamed, including remote lookups finished by the other reconciler
    if (auto known = identities_.Peek(id)) {
      names[id] = known->name;
    } else {
      pending.push_back(id);
    }
  }

  if (!pending.empty()) {
    auto local = repo_->FindParticipantNames(*tx, session_id_, pending);
    auto cache = repo_->FindInviterNames(*tx, pending);
    for (const auto& id : pending) {
      if (auto it = local.find(id); it != local.end()) {
        names[id] = it->second;
      } else if (auto jt = cache.find(id); jt != cache.end()) {
        names[id] = jt->second;
      } else if (auto any = repo_->FindAnyParticipantName(*tx, id)) {
        names[id] = *any;
      }
    }
  }

  const auto row_ids = repo_->FindViewerIds(*tx, viewers);

  std::vector<db::model::InvitationUpdate> updates;
  std::size_t                              still_unresolved = 0;
  for (const auto& [key, u] : unresolved) {
    auto name = names.find(u.inviter_id);
    auto row  = row_ids.find(key);
    if (name == names.end() || row == row_ids.end()) {
      ++still_unresolved;
      continue;
    }
    updates.push_back({row->second, name->second, identities_.IsHost(u.inviter_id)});
  }

  for (std::size_t i = 0; i < updates.size(); i += kBackfillChunkRows) {
    const auto end = std::min(updates.size(), i + kBackfillChunkRows);
    std::vector<db::model::InvitationUpdate> chunk(updates.begin() + i, updates.begin() + end);
    auto r = repo_->UpdateInvitations(*tx, chunk);
    if (!r) {
      tx->Rollback();
      throw util::PersistenceError(std::string("invitation backfill: ") + db::ToString(r.code) + ": " + r.message);
    }
  }
  tx->Commit();

  LIVEVIEWER_LOG_INFO("invitation backfill finished",
                      {StringField("session", session_id_), IntField("updated", static_cast<int64_t>(updates.size())),
                       IntField("unresolved", static_cast<int64_t>(still_unresolved))});
  return updates.size();
}

} // namespace liveviewer::ingest
