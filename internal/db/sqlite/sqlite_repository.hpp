#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace liveviewer::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

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
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
