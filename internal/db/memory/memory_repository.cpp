#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace liveviewer::db::memory {

namespace {

std::unordered_set<std::string> ToSet(const std::vector<std::string>& values) {
  return {values.begin(), values.end()};
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSession(Transaction& t, model::SessionRecord& r) {
  if (r.session_id.empty()) return Result::Err(ErrorCode::InvalidArgument, "session_id is empty");

  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.session_id);
  if (it != s.sessions.end()) {
    r.id = it->second.id;
  } else if (r.id == 0) {
    r.id = s.next_session_id++;
  } else {
    s.next_session_id = std::max(s.next_session_id, r.id + 1);
  }
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(session_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Viewers
// ------------------------------------------------------------------

Result MemoryRepository::InsertViewers(Transaction& t, std::vector<model::ViewerRecord>& viewers) {
  auto& s = TX(t).Mutable();

  // validate the whole batch first so a failure leaves no partial writes
  std::unordered_set<std::string> batch_keys;
  for (const auto& v : viewers) {
    const auto key = v.Key().ToString();
    if (s.viewer_keys.contains(key) || !batch_keys.insert(key).second) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate viewer " + key);
    }
  }

  const auto now = util::NowMillis();
  for (auto& v : viewers) {
    v.id = s.next_viewer_id++;
    if (v.created_at_ms == 0) v.created_at_ms = now;
    v.updated_at_ms = now;
    s.viewer_keys[v.Key().ToString()] = v.id;
    s.viewers[v.id]                   = v;
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateViewers(Transaction& t, const std::vector<model::ViewerRecord>& viewers) {
  auto& s = TX(t).Mutable();
  for (const auto& v : viewers) {
    if (!s.viewers.contains(v.id)) return Result::Err(ErrorCode::NotFound, "viewer " + std::to_string(v.id));
  }

  const auto now = util::NowMillis();
  for (const auto& v : viewers) {
    auto& dst = s.viewers[v.id];
    if (dst.Key().ToString() != v.Key().ToString()) {
      s.viewer_keys.erase(dst.Key().ToString());
      s.viewer_keys[v.Key().ToString()] = v.id;
    }
    const auto created = dst.created_at_ms;
    dst                = v;
    dst.created_at_ms  = created;
    dst.updated_at_ms  = now;
  }
  return Result::Ok();
}

std::vector<model::ViewerRecord> MemoryRepository::ListViewersBySession(Transaction& t, const std::string& session_id) {
  return ListViewersBySessions(t, {session_id});
}

std::vector<model::ViewerRecord> MemoryRepository::ListViewersBySessions(Transaction& t,
                                                                         const std::vector<std::string>& session_ids) {
  const auto                       wanted = ToSet(session_ids);
  std::vector<model::ViewerRecord> out;
  for (const auto& [_, v] : TX(t).View().viewers) {
    if (wanted.contains(v.session_id)) out.push_back(v);
  }
  return out;
}

std::unordered_map<std::string, int64_t> MemoryRepository::FindViewerIds(
    Transaction& t, const std::vector<liveviewer::model::ViewerKey>& keys) {
  const auto&                              s = TX(t).View();
  std::unordered_map<std::string, int64_t> out;
  for (const auto& key : keys) {
    const auto k  = key.ToString();
    auto       it = s.viewer_keys.find(k);
    if (it != s.viewer_keys.end()) out[k] = it->second;
  }
  return out;
}

std::unordered_map<std::string, std::string> MemoryRepository::FindParticipantNames(
    Transaction& t, const std::string& session_id, const std::vector<std::string>& participant_ids) {
  const auto                                   wanted = ToSet(participant_ids);
  std::unordered_map<std::string, std::string> out;
  for (const auto& [_, v] : TX(t).View().viewers) {
    if (v.session_id == session_id && !v.display_name.empty() && wanted.contains(v.participant_id)) {
      out[v.participant_id] = v.display_name;
    }
  }
  return out;
}

std::optional<std::string> MemoryRepository::FindAnyParticipantName(Transaction& t, const std::string& participant_id) {
  const auto& viewers = TX(t).View().viewers;
  for (auto it = viewers.rbegin(); it != viewers.rend(); ++it) {
    if (it->second.participant_id == participant_id && !it->second.display_name.empty()) {
      return it->second.display_name;
    }
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateInvitations(Transaction& t, const std::vector<model::InvitationUpdate>& updates) {
  auto&      s   = TX(t).Mutable();
  const auto now = util::NowMillis();
  for (const auto& u : updates) {
    auto it = s.viewers.find(u.viewer_id);
    if (it == s.viewers.end()) continue;
    it->second.inviter_name    = u.inviter_name;
    it->second.invited_by_host = u.invited_by_host;
    it->second.updated_at_ms   = now;
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateRewardSummaries(Transaction& t, const std::vector<model::RewardSummaryUpdate>& updates) {
  auto&      s   = TX(t).Mutable();
  const auto now = util::NowMillis();
  for (const auto& u : updates) {
    auto it = s.viewers.find(u.viewer_id);
    if (it == s.viewers.end()) return Result::Err(ErrorCode::NotFound, "viewer " + std::to_string(u.viewer_id));
    it->second.reward_eligible = u.reward_eligible;
    it->second.reward_amount   = u.reward_amount;
    it->second.reward_status   = u.reward_status;
    it->second.updated_at_ms   = now;
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateSignSummaries(Transaction& t, const std::vector<model::SignSummaryUpdate>& updates) {
  auto&      s   = TX(t).Mutable();
  const auto now = util::NowMillis();
  for (const auto& u : updates) {
    auto it = s.viewers.find(u.viewer_id);
    if (it == s.viewers.end()) return Result::Err(ErrorCode::NotFound, "viewer " + std::to_string(u.viewer_id));
    it->second.signed_in         = u.signed_in;
    it->second.last_sign_time_ms = u.last_sign_time_ms;
    it->second.sign_count        = u.sign_count;
    it->second.updated_at_ms     = now;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sign-in details
// ------------------------------------------------------------------

Result MemoryRepository::InsertSignRecords(Transaction& t, std::vector<model::SignRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    if (!s.viewers.contains(r.viewer_record_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "sign record references unknown viewer " + std::to_string(r.viewer_record_id));
    }
  }
  for (auto& r : records) {
    r.id = s.next_sign_id++;
    s.sign_records.push_back(r);
  }
  return Result::Ok();
}

std::unordered_map<int64_t, model::SignAggregate> MemoryRepository::AggregateSignRecords(
    Transaction& t, const std::vector<std::string>& session_ids) {
  const auto                                        wanted = ToSet(session_ids);
  std::unordered_map<int64_t, model::SignAggregate> out;
  for (const auto& r : TX(t).View().sign_records) {
    if (!r.valid || !wanted.contains(r.session_id)) continue;
    auto& agg = out[r.viewer_record_id];
    agg.count++;
    agg.last_sign_time_ms = std::max(agg.last_sign_time_ms, r.sign_time_ms);
  }
  return out;
}

// ------------------------------------------------------------------
// Rewards
// ------------------------------------------------------------------

Result MemoryRepository::DeleteRewardsBySessions(Transaction& t, const std::vector<std::string>& session_ids) {
  const auto wanted  = ToSet(session_ids);
  auto&      rewards = TX(t).Mutable().rewards;
  for (auto it = rewards.begin(); it != rewards.end();) {
    if (wanted.contains(it->second.session_id)) {
      it = rewards.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::InsertRewards(Transaction& t, std::vector<model::RewardRecord>& rewards) {
  auto&      s   = TX(t).Mutable();
  const auto now = util::NowMillis();
  for (auto& r : rewards) {
    r.id = s.next_reward_id++;
    if (r.created_at_ms == 0) r.created_at_ms = now;
    r.updated_at_ms   = now;
    s.rewards[r.id] = r;
  }
  return Result::Ok();
}

std::vector<model::RewardRecord> MemoryRepository::ListRewardsBySession(Transaction& t, const std::string& session_id) {
  std::vector<model::RewardRecord> out;
  for (const auto& [_, r] : TX(t).View().rewards) {
    if (r.session_id == session_id) out.push_back(r);
  }
  return out;
}

std::vector<model::RewardRecord> MemoryRepository::SampleRewardsBySession(Transaction& t, const std::string& session_id,
                                                                          std::size_t limit) {
  std::vector<model::RewardRecord> out;
  for (const auto& [_, r] : TX(t).View().rewards) {
    if (out.size() >= limit) break;
    if (r.session_id == session_id) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Inviter name cache
// ------------------------------------------------------------------

Result MemoryRepository::UpsertInviterNames(Transaction& t, const std::vector<model::InviterCacheRecord>& records) {
  auto&      s   = TX(t).Mutable();
  const auto now = util::NowMillis();
  for (const auto& r : records) {
    auto& dst         = s.inviter_names[r.inviter_id];
    dst               = r;
    dst.updated_at_ms = now;
  }
  return Result::Ok();
}

std::vector<model::InviterCacheRecord> MemoryRepository::ListInviterNames(Transaction& t) {
  std::vector<model::InviterCacheRecord> out;
  for (const auto& [_, r] : TX(t).View().inviter_names) {
    out.push_back(r);
  }
  return out;
}

std::unordered_map<std::string, std::string> MemoryRepository::FindInviterNames(Transaction&                    t,
                                                                                 const std::vector<std::string>& inviter_ids) {
  const auto&                                  s = TX(t).View();
  std::unordered_map<std::string, std::string> out;
  for (const auto& id : inviter_ids) {
    auto it = s.inviter_names.find(id);
    if (it != s.inviter_names.end()) out[id] = it->second.name;
  }
  return out;
}

} // namespace liveviewer::db::memory
