#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/inviter_cache_record.hpp"
#include "internal/db/model/reward_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/sign_record.hpp"
#include "internal/db/model/viewer_record.hpp"

namespace liveviewer::db {

/*
  Repository abstraction (the durable store).

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - (session_id, kind, participant_id) is unique for viewer rows
  - Bulk inserts assign row ids back into the passed records

  The DB is the source of truth for:
    viewers
    sign-in details
    reward records
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result UpsertSession(Transaction&, model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Viewers
  // ---------------------------------------------------------------------

  virtual Result InsertViewers(Transaction&, std::vector<model::ViewerRecord>& viewers) = 0;

  // Full-row update keyed by ViewerRecord::id.
  virtual Result UpdateViewers(Transaction&, const std::vector<model::ViewerRecord>& viewers) = 0;

  virtual std::vector<model::ViewerRecord> ListViewersBySession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::ViewerRecord> ListViewersBySessions(Transaction&, const std::vector<std::string>& session_ids) = 0;

  // Row ids for the given keys; missing keys are absent from the map (keyed by ViewerKey::ToString()).
  virtual std::unordered_map<std::string, int64_t> FindViewerIds(Transaction&, const std::vector<liveviewer::model::ViewerKey>& keys) = 0;

  // Display names of participants within one session, keyed by participant id.
  virtual std::unordered_map<std::string, std::string> FindParticipantNames(Transaction&, const std::string& session_id,
                                                                           const std::vector<std::string>& participant_ids) = 0;

  // Most recent non-empty display name for a participant in any session.
  virtual std::optional<std::string> FindAnyParticipantName(Transaction&, const std::string& participant_id) = 0;

  virtual Result UpdateInvitations(Transaction&, const std::vector<model::InvitationUpdate>& updates) = 0;

  virtual Result UpdateRewardSummaries(Transaction&, const std::vector<model::RewardSummaryUpdate>& updates) = 0;

  virtual Result UpdateSignSummaries(Transaction&, const std::vector<model::SignSummaryUpdate>& updates) = 0;

  // ---------------------------------------------------------------------
  // Sign-in details
  // ---------------------------------------------------------------------

  virtual Result InsertSignRecords(Transaction&, std::vector<model::SignRecord>& records) = 0;

  // Aggregates of valid sign records keyed by viewer row id.
  virtual std::unordered_map<int64_t, model::SignAggregate> AggregateSignRecords(Transaction&,
                                                                                const std::vector<std::string>& session_ids) = 0;

  // ---------------------------------------------------------------------
  // Rewards
  // ---------------------------------------------------------------------

  virtual Result DeleteRewardsBySessions(Transaction&, const std::vector<std::string>& session_ids) = 0;

  virtual Result InsertRewards(Transaction&, std::vector<model::RewardRecord>& rewards) = 0;

  virtual std::vector<model::RewardRecord> ListRewardsBySession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::RewardRecord> SampleRewardsBySession(Transaction&, const std::string& session_id, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Inviter name cache
  // ---------------------------------------------------------------------

  virtual Result UpsertInviterNames(Transaction&, const std::vector<model::InviterCacheRecord>& records) = 0;

  virtual std::vector<model::InviterCacheRecord> ListInviterNames(Transaction&) = 0;

  virtual std::unordered_map<std::string, std::string> FindInviterNames(Transaction&, const std::vector<std::string>& inviter_ids) = 0;
};

} // namespace liveviewer::db
