#include "replay_platform_api.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "wire_json.hpp"

namespace liveviewer::platform {
namespace {

// Directory error code the platform returns for unknown ids.
constexpr int kErrUnknownId = 60111;

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ApiError("cannot open " + path.string());
  }
  std::ostringstream body;
  body << in.rdbuf();
  return body.str();
}

// Ids become file names; anything that could escape the directory is refused.
bool SafeFileStem(const std::string& id) {
  return !id.empty() && id.find('/') == std::string::npos && id.find('\\') == std::string::npos && id != "." &&
         id != "..";
}

} // namespace

ReplayPlatformApi::ReplayPlatformApi(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path ReplayPlatformApi::PagePath(const std::string& session_id, std::size_t page) const {
  return root_ / session_id / ("page_" + std::to_string(page) + ".json");
}

wire::WatchStatResponse ReplayPlatformApi::GetWatchStatistics(const std::string& session_id, const std::string& cursor) {
  if (!SafeFileStem(session_id)) {
    throw ApiError("invalid session id '" + session_id + "'");
  }

  if (cursor.empty()) {
    return ParseWatchStatResponse(ReadFile(PagePath(session_id, 1)));
  }

  // walk the captured chain until the page whose next_key matches the cursor
  for (std::size_t n = 1;; ++n) {
    const auto path = PagePath(session_id, n);
    if (!std::filesystem::exists(path)) break;

    const auto page = ParseWatchStatResponse(ReadFile(path));
    if (page.next_key() == cursor) {
      return ParseWatchStatResponse(ReadFile(PagePath(session_id, n + 1)));
    }
  }

  throw ApiError("no captured page follows cursor '" + cursor + "' for session " + session_id);
}

wire::UserInfoResponse ReplayPlatformApi::LookupUser(const std::string& user_id) {
  const auto path = root_ / "users" / (user_id + ".json");
  if (!SafeFileStem(user_id) || !std::filesystem::exists(path)) {
    wire::UserInfoResponse missing;
    missing.set_errcode(kErrUnknownId);
    missing.set_errmsg("invalid userid");
    return missing;
  }
  return ParseUserInfoResponse(ReadFile(path));
}

wire::ExternalContactResponse ReplayPlatformApi::LookupExternalContact(const std::string& external_user_id) {
  const auto path = root_ / "contacts" / (external_user_id + ".json");
  if (!SafeFileStem(external_user_id) || !std::filesystem::exists(path)) {
    wire::ExternalContactResponse missing;
    missing.set_errcode(kErrUnknownId);
    missing.set_errmsg("invalid external userid");
    return missing;
  }
  return ParseExternalContactResponse(ReadFile(path));
}

} // namespace liveviewer::platform
