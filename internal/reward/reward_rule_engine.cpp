#include "reward_rule_engine.hpp"

#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace liveviewer::reward {

using liveviewer::model::RewardRuleType;
using observability::IntField;
using observability::StringField;

namespace {

std::string Validate(const RewardRequest& request) {
  if (request.sessions.empty()) return "no sessions selected";
  if (request.batch_id.empty()) return "batch id is empty";
  if (request.min_cross_session_watch_count < 0) return "cross-session watch count must not be negative";

  for (const auto& s : request.sessions) {
    if (s.session_id.empty()) return "session id is empty";
    if (s.rule_sign_count < 0) return "sign count threshold must not be negative for " + s.session_id;
    if (s.rule_watch_seconds < 0) return "watch time threshold must not be negative for " + s.session_id;
    if (s.reward_amount < 0) return "reward amount must not be negative for " + s.session_id;
  }
  return {};
}

// First occurrence of each session wins.
std::vector<SessionRule> Dedupe(const std::vector<SessionRule>& sessions) {
  std::vector<SessionRule>        out;
  std::unordered_set<std::string> seen;
  for (const auto& s : sessions) {
    if (seen.insert(s.session_id).second) {
      out.push_back(s);
    } else {
      LIVEVIEWER_LOG_WARN("duplicate session in reward request ignored", {StringField("session", s.session_id)});
    }
  }
  return out;
}

std::string ParticipantKey(const db::model::ViewerRecord& v) {
  return std::to_string(liveviewer::model::ToStorage(v.kind)) + "#" + v.participant_id;
}

void Check(const db::Result& r, const char* step) {
  if (!r) {
    throw util::PersistenceError(std::string(step) + ": " + db::ToString(r.code) + ": " + r.message);
  }
}

} // namespace

RewardRuleEngine::RewardRuleEngine(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

RewardOutcome RewardRuleEngine::ComputeRewards(const RewardRequest& request) {
  RewardOutcome outcome;

  if (auto error = Validate(request); !error.empty()) {
    outcome.message = error;
    LIVEVIEWER_LOG_WARN("reward request rejected", {StringField("error", error)});
    return outcome;
  }

  const auto sessions = Dedupe(request.sessions);

  std::vector<std::string>                            session_ids;
  std::unordered_map<std::string, const SessionRule*> rules;
  for (const auto& s : sessions) {
    session_ids.push_back(s.session_id);
    rules[s.session_id] = &s;
  }

  try {
    auto tx = repo_->Begin();

    for (const auto& id : session_ids) {
      if (!repo_->GetSession(*tx, id)) {
        tx->Rollback();
        outcome.message = "session " + id + " not found";
        return outcome;
      }
    }

    const auto viewers = repo_->ListViewersBySessions(*tx, session_ids);
    const auto signs   = repo_->AggregateSignRecords(*tx, session_ids);

    // participant -> distinct selected sessions it appears in
    std::unordered_map<std::string, std::unordered_set<std::string>> appearances;
    for (const auto& v : viewers) appearances[ParticipantKey(v)].insert(v.session_id);

    std::vector<db::model::RewardRecord>        rewards;
    std::vector<db::model::RewardSummaryUpdate> summaries;
    rewards.reserve(viewers.size());
    summaries.reserve(viewers.size());

    for (const auto& v : viewers) {
      const auto& rule = *rules.at(v.session_id);

      liveviewer::model::EligibilityFacts facts;
      auto sign_it              = signs.find(v.id);
      facts.sign_count          = sign_it != signs.end() ? sign_it->second.count : v.sign_count;
      facts.watch_seconds       = v.watch_seconds;
      facts.cross_session_count = static_cast<int64_t>(appearances[ParticipantKey(v)].size());

      const liveviewer::model::EligibilityThresholds thresholds{rule.rule_sign_count, rule.rule_watch_seconds,
                                                                request.min_cross_session_watch_count};

      const bool   eligible = liveviewer::model::IsEligible(request.rule_type, facts, thresholds);
      const double amount   = eligible ? rule.reward_amount : 0.0;

      db::model::RewardRecord r;
      r.session_id           = v.session_id;
      r.viewer_record_id     = v.id;
      r.rule_type            = request.rule_type;
      r.rule_sign_count      = rule.rule_sign_count;
      r.rule_watch_seconds   = rule.rule_watch_seconds;
      r.rule_watch_count     = request.min_cross_session_watch_count;
      r.calculation_batch_id = request.batch_id;
      r.reward_amount        = amount;
      r.eligible             = eligible;
      rewards.push_back(std::move(r));

      summaries.push_back({v.id, eligible, amount,
                           eligible ? db::model::kRewardStatusPending : db::model::kRewardStatusIneligible});

      if (eligible) {
        ++outcome.eligible_count;
        outcome.total_amount += amount;
      }
    }

    Check(repo_->DeleteRewardsBySessions(*tx, session_ids), "delete previous rewards");
    Check(repo_->InsertRewards(*tx, rewards), "insert rewards");
    Check(repo_->UpdateRewardSummaries(*tx, summaries), "update reward summaries");
    tx->Commit();

    outcome.processed = viewers.size();
  } catch (const std::exception& e) {
    outcome = RewardOutcome{};
    outcome.message = std::string("reward computation failed: ") + e.what();
    LIVEVIEWER_LOG_ERROR("reward computation failed",
                         {StringField("batch", request.batch_id), StringField("error", e.what())});
    return outcome;
  }

  outcome.success = true;
  outcome.message = "rewards computed";
  LIVEVIEWER_LOG_INFO("rewards computed",
                      {StringField("batch", request.batch_id),
                       StringField("rule", liveviewer::model::ToWire(request.rule_type)),
                       IntField("sessions", static_cast<int64_t>(session_ids.size())),
                       IntField("processed", static_cast<int64_t>(outcome.processed)),
                       IntField("eligible", static_cast<int64_t>(outcome.eligible_count))});
  return outcome;
}

ConsistencyReport RewardRuleEngine::CheckRuleConsistency(const std::vector<SessionRule>& sessions,
                                                         RewardRuleType rule_type, int64_t min_cross_session_watch_count,
                                                         std::size_t samples_per_session) {
  ConsistencyReport report;
  if (samples_per_session == 0) samples_per_session = 1;

  const auto expected_type = std::string(liveviewer::model::ToWire(rule_type));
  try {
    auto tx = repo_->Begin();
    for (const auto& s : Dedupe(sessions)) {
      std::vector<db::model::RewardRecord> samples;
      try {
        samples = repo_->SampleRewardsBySession(*tx, s.session_id, samples_per_session);
      } catch (const util::PersistenceError& e) {
        report.mismatches.push_back({s.session_id, "", "rule_type", expected_type, std::string("unreadable: ") + e.what()});
        continue;
      }
      if (samples.empty()) {
        report.sessions_without_rewards.push_back(s.session_id);
        continue;
      }

      for (const auto& r : samples) {
        auto compare = [&](const char* field, const std::string& expected, const std::string& actual) {
          if (expected != actual) report.mismatches.push_back({s.session_id, r.calculation_batch_id, field, expected, actual});
        };
        compare("rule_type", expected_type, std::string(liveviewer::model::ToWire(r.rule_type)));
        compare("rule_sign_count", std::to_string(s.rule_sign_count), std::to_string(r.rule_sign_count));
        compare("rule_watch_seconds", std::to_string(s.rule_watch_seconds), std::to_string(r.rule_watch_seconds));
        compare("rule_watch_count", std::to_string(min_cross_session_watch_count), std::to_string(r.rule_watch_count));
      }
    }
    tx->Commit();
  } catch (const std::exception& e) {
    report            = ConsistencyReport{};
    report.consistent = false;
    report.error      = std::string("consistency check failed: ") + e.what();
    LIVEVIEWER_LOG_ERROR("reward rule consistency check failed", {StringField("error", e.what())});
    return report;
  }

  report.consistent = report.mismatches.empty() && report.sessions_without_rewards.empty();
  if (!report.consistent) {
    LIVEVIEWER_LOG_WARN("reward rules differ from stored results",
                        {IntField("mismatches", static_cast<int64_t>(report.mismatches.size())),
                         IntField("sessions_without_rewards",
                                  static_cast<int64_t>(report.sessions_without_rewards.size()))});
  }
  return report;
}

std::string RewardRuleEngine::GenerateBatchId(const std::string& operator_id, RewardRuleType rule_type,
                                              util::TimePoint now) {
  return util::FormatCompactTimestamp(now) + "-" + operator_id + "-" + std::string(liveviewer::model::ToWire(rule_type));
}

} // namespace liveviewer::reward
