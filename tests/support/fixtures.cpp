#include "fixtures.hpp"

#include <cassert>
#include <filesystem>

namespace liveviewer::testing {

platform::wire::WatchStatUser User(const std::string& id, const std::string& name, int64_t watch_seconds,
                                   const std::string& invitor_userid, const std::string& invitor_external_userid) {
  platform::wire::WatchStatUser u;
  u.set_userid(id);
  u.set_name(name);
  u.set_watch_time(watch_seconds);
  u.set_invitor_userid(invitor_userid);
  u.set_invitor_external_userid(invitor_external_userid);
  return u;
}

platform::wire::WatchStatExternalUser External(const std::string& id, const std::string& name, int64_t watch_seconds,
                                               const std::string& invitor_external_userid,
                                               const std::string& invitor_userid) {
  platform::wire::WatchStatExternalUser u;
  u.set_external_userid(id);
  u.set_name(name);
  u.set_type(1);
  u.set_watch_time(watch_seconds);
  u.set_invitor_external_userid(invitor_external_userid);
  u.set_invitor_userid(invitor_userid);
  return u;
}

void SeedSession(db::Repository& repo, const std::string& session_id, const std::string& host_id,
                 const std::string& host_name, int64_t duration_seconds) {
  db::model::SessionRecord s;
  s.session_id       = session_id;
  s.theme            = "weekly briefing";
  s.host_id          = host_id;
  s.host_name        = host_name;
  s.duration_seconds = duration_seconds;

  auto tx = repo.Begin();
  auto r  = repo.UpsertSession(*tx, s);
  assert(r);
  tx->Commit();
}

std::vector<db::model::ViewerRecord> Viewers(db::Repository& repo, const std::string& session_id) {
  auto tx   = repo.Begin();
  auto rows = repo.ListViewersBySession(*tx, session_id);
  tx->Commit();
  return rows;
}

const db::model::ViewerRecord* Find(const std::vector<db::model::ViewerRecord>& rows,
                                    liveviewer::model::ParticipantKind kind, const std::string& participant_id) {
  for (const auto& row : rows) {
    if (row.kind == kind && row.participant_id == participant_id) return &row;
  }
  return nullptr;
}

std::string TempDbPath(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() / ("liveviewer-" + name + ".db");
  for (const auto* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path.string();
}

} // namespace liveviewer::testing
