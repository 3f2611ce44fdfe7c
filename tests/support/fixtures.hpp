#pragma once

#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "liveviewer/platform/v1.hpp"

namespace liveviewer::testing {

platform::wire::WatchStatUser User(const std::string& id, const std::string& name, int64_t watch_seconds,
                                   const std::string& invitor_userid          = "",
                                   const std::string& invitor_external_userid = "");

platform::wire::WatchStatExternalUser External(const std::string& id, const std::string& name, int64_t watch_seconds,
                                               const std::string& invitor_external_userid = "",
                                               const std::string& invitor_userid          = "");

void SeedSession(db::Repository& repo, const std::string& session_id, const std::string& host_id = "host1",
                 const std::string& host_name = "Host One", int64_t duration_seconds = 3600);

std::vector<db::model::ViewerRecord> Viewers(db::Repository& repo, const std::string& session_id);

// nullptr when absent
const db::model::ViewerRecord* Find(const std::vector<db::model::ViewerRecord>& rows,
                                    liveviewer::model::ParticipantKind kind, const std::string& participant_id);

// Fresh file path under the system temp directory; any previous file is removed.
std::string TempDbPath(const std::string& name);

} // namespace liveviewer::testing
