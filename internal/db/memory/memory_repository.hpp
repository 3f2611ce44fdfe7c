#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace liveviewer::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and by `database: { memory: {} }`.

  Transactions are serialized: each one holds the repository lock from
  Begin() until Commit()/Rollback() and works on a private copy.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertSession(Transaction&, model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;

  Result InsertViewers(Transaction&, std::vector<model::ViewerRecord>&) override;
  Result UpdateViewers(Transaction&, const std::vector<model::ViewerRecord>&) override;
  std::vector<model::ViewerRecord> ListViewersBySession(Transaction&, const std::string&) override;
  std::vector<model::ViewerRecord> ListViewersBySessions(Transaction&, const std::vector<std::string>&) override;
  std::unordered_map<std::string, int64_t> FindViewerIds(Transaction&,
                                                         const std::vector<liveviewer::model::ViewerKey>&) override;
  std::unordered_map<std::string, std::string> FindParticipantNames(Transaction&, const std::string& session_id,
                                                                   const std::vector<std::string>& participant_ids) override;
  std::optional<std::string> FindAnyParticipantName(Transaction&, const std::string& participant_id) override;
  Result UpdateInvitations(Transaction&, const std::vector<model::InvitationUpdate>&) override;
  Result UpdateRewardSummaries(Transaction&, const std::vector<model::RewardSummaryUpdate>&) override;
  Result UpdateSignSummaries(Transaction&, const std::vector<model::SignSummaryUpdate>&) override;

  Result InsertSignRecords(Transaction&, std::vector<model::SignRecord>&) override;
  std::unordered_map<int64_t, model::SignAggregate> AggregateSignRecords(Transaction&,
                                                                        const std::vector<std::string>&) override;

  Result DeleteRewardsBySessions(Transaction&, const std::vector<std::string>&) override;
  Result InsertRewards(Transaction&, std::vector<model::RewardRecord>&) override;
  std::vector<model::RewardRecord> ListRewardsBySession(Transaction&, const std::string&) override;
  std::vector<model::RewardRecord> SampleRewardsBySession(Transaction&, const std::string&, std::size_t) override;

  Result UpsertInviterNames(Transaction&, const std::vector<model::InviterCacheRecord>&) override;
  std::vector<model::InviterCacheRecord> ListInviterNames(Transaction&) override;
  std::unordered_map<std::string, std::string> FindInviterNames(Transaction&, const std::vector<std::string>&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SessionRecord> sessions;
    int64_t                                               next_session_id = 1;

    std::map<int64_t, model::ViewerRecord>   viewers;
    std::unordered_map<std::string, int64_t> viewer_keys;
    int64_t                                  next_viewer_id = 1;

    std::vector<model::SignRecord> sign_records;
    int64_t                        next_sign_id = 1;

    std::map<int64_t, model::RewardRecord> rewards;
    int64_t                                next_reward_id = 1;

    std::unordered_map<std::string, model::InviterCacheRecord> inviter_names;
  };

  std::mutex mutex_;
  State      committed_;
};

}
