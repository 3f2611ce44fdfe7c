#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using liveviewer::model::RewardRuleType;
using liveviewer::reward::SessionRule;

static void Usage() {
  std::cout << "Usage:\n"
            << "  liveviewer --config <config.yaml> add-session <session_id> <host_id> <host_name> <duration_sec> [theme]\n"
            << "  liveviewer --config <config.yaml> ingest <session_id>\n"
            << "  liveviewer --config <config.yaml> sync-signs <session_id>\n"
            << "  liveviewer --config <config.yaml> stats <session_id>\n"
            << "  liveviewer --config <config.yaml> compute-rewards <rule> <min_cross_sessions> <session>:<signs>:<watch_sec>:<amount>...\n"
            << "  liveviewer --config <config.yaml> check-rules <rule> <min_cross_sessions> <session>:<signs>:<watch_sec>...\n"
            << "\n"
            << "  rule: sign | watch | count | sign-watch | sign-count | watch-count | all-or | all-and\n";
}

static std::vector<std::string> Split(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::stringstream        in(s);
  std::string              part;
  while (std::getline(in, part, sep)) parts.push_back(part);
  return parts;
}

// <session>:<signs>:<watch_sec>[:<amount>]
static std::optional<SessionRule> ParseSessionRule(const std::string& arg, bool amount_required) {
  const auto parts = Split(arg, ':');
  if (parts.size() < 3 || parts.size() > 4 || (amount_required && parts.size() != 4)) return std::nullopt;

  try {
    SessionRule rule;
    rule.session_id         = parts[0];
    rule.rule_sign_count    = std::stoll(parts[1]);
    rule.rule_watch_seconds = std::stoll(parts[2]);
    if (parts.size() == 4) rule.reward_amount = std::stod(parts[3]);
    return rule;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static int RunCommand(liveviewer::factory::Application& app, const liveviewer::runtime::config::RuntimeConfig& config,
                      const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "add-session") {
    if (args.size() < 5) return 1;

    liveviewer::db::model::SessionRecord session;
    session.session_id       = args[1];
    session.host_id          = args[2];
    session.host_name        = args[3];
    session.duration_seconds = std::stoll(args[4]);
    session.start_time_ms    = liveviewer::util::NowMillis();
    if (args.size() >= 6) session.theme = args[5];

    auto tx = app.repository->Begin();
    auto r  = app.repository->UpsertSession(*tx, session);
    if (!r) {
      tx->Rollback();
      std::cerr << liveviewer::db::ToString(r.code) << ": " << r.message << "\n";
      return 2;
    }
    tx->Commit();
    std::cout << "session " << session.session_id << " id=" << session.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (args.size() != 2) return 1;
    if (!app.platform) {
      std::cerr << "no platform source configured (platform.replay_dir)\n";
      return 1;
    }

    const auto outcome = app.ingestion->ProcessViewerInfo(args[1]);
    const auto& s      = outcome.stats;
    std::cout << "success=" << (outcome.success ? "true" : "false") << " partial=" << (outcome.partial ? "true" : "false")
              << "\n"
              << "viewers=" << s.total_viewers << " internal=" << s.internal_viewers << " external=" << s.external_viewers
              << "\n"
              << "processed_ok=" << s.success_count << " errors=" << s.error_count
              << " total_watch_seconds=" << s.total_watch_seconds << "\n"
              << "message=" << outcome.message << "\n";
    return outcome.success ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "sync-signs") {
    if (args.size() != 2) return 1;

    const auto result = app.ingestion->SyncSignInfo(args[1]);
    std::cout << "updated=" << result.updated << " errors=" << result.errors << " message=" << result.message << "\n";
    return result.success ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    if (args.size() != 2) return 1;

    const auto s = app.ingestion->GetViewerStatistics(args[1]);
    std::cout << "viewers=" << s.total_viewers << " internal=" << s.internal_viewers << " external=" << s.external_viewers
              << "\n"
              << "total_watch_seconds=" << s.total_watch_seconds << " avg_watch_seconds=" << s.average_watch_seconds
              << " avg_watch_percentage=" << s.average_watch_percentage << "\n"
              << "comments=" << s.comment_count << " mic=" << s.mic_count << " signed_in=" << s.signed_in_count
              << " sign_rate=" << s.sign_rate << "\n"
              << "total_comments=" << s.total_comments << " total_mic_seconds=" << s.total_mic_seconds << "\n"
              << "invited=" << s.invited_count << " invited_by_host=" << s.invited_by_host_count << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "compute-rewards" || cmd == "check-rules") {
    if (args.size() < 4) return 1;

    const auto rule = liveviewer::model::ParseRewardRuleType(args[1]);
    if (!rule) {
      std::cerr << "unsupported rule: " << args[1] << "\n";
      return 1;
    }
    const int64_t min_cross = std::stoll(args[2]);

    const bool               compute = cmd == "compute-rewards";
    std::vector<SessionRule> sessions;
    for (std::size_t i = 3; i < args.size(); ++i) {
      auto parsed = ParseSessionRule(args[i], compute);
      if (!parsed) {
        std::cerr << "invalid session rule: " << args[i] << "\n";
        return 1;
      }
      sessions.push_back(*parsed);
    }

    if (compute) {
      liveviewer::reward::RewardRequest request;
      request.sessions                      = sessions;
      request.rule_type                     = *rule;
      request.min_cross_session_watch_count = min_cross;
      request.batch_id = liveviewer::reward::RewardRuleEngine::GenerateBatchId(config.rewards().operator_id(), *rule,
                                                                               liveviewer::util::Now());

      const auto outcome = app.rewards->ComputeRewards(request);
      std::cout << "batch=" << request.batch_id << " success=" << (outcome.success ? "true" : "false")
                << " processed=" << outcome.processed << " eligible=" << outcome.eligible_count
                << " total_amount=" << outcome.total_amount << "\n"
                << "message=" << outcome.message << "\n";
      return outcome.success ? 0 : 2;
    }

    const auto report = app.rewards->CheckRuleConsistency(sessions, *rule, min_cross,
                                                          config.rewards().consistency_samples_per_session());
    if (!report.error.empty()) {
      std::cerr << report.error << "\n";
      return 2;
    }
    std::cout << "consistent=" << (report.consistent ? "true" : "false") << "\n";
    for (const auto& m : report.mismatches) {
      std::cout << "mismatch session=" << m.session_id << " batch=" << m.batch_id << " field=" << m.field
                << " expected=" << m.expected << " actual=" << m.actual << "\n";
    }
    for (const auto& s : report.sessions_without_rewards) {
      std::cout << "no-rewards session=" << s << "\n";
    }
    return report.consistent ? 0 : 3;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = liveviewer::config::ConfigLoader::LoadFromYaml(config_path);
    liveviewer::observability::InitializeLogging(config);

    auto app = liveviewer::factory::Build(config);

    const int rc = RunCommand(app, config, args);
    if (rc == 1) Usage();

    liveviewer::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    LIVEVIEWER_LOG_ERROR("Fatal error", {liveviewer::observability::StringField("error", e.what())});
    liveviewer::observability::ShutdownLogging();
    return 2;
  }
}
