#pragma once

#include <filesystem>
#include <string>

#include "live_platform_api.hpp"

namespace liveviewer::platform {

/*
  Serves captured API responses from disk.

  Layout:
    <root>/<session_id>/page_<n>.json   statistics pages, n starting at 1
    <root>/users/<user_id>.json         internal user lookups
    <root>/contacts/<external_id>.json  external contact lookups

  The cursor handed back to the collector is the next_key captured in
  the previous page; the page that follows it is page_<n+1>.
*/
class ReplayPlatformApi final : public LivePlatformApi {
 public:
  explicit ReplayPlatformApi(std::filesystem::path root);

  wire::WatchStatResponse       GetWatchStatistics(const std::string& session_id, const std::string& cursor) override;
  wire::UserInfoResponse        LookupUser(const std::string& user_id) override;
  wire::ExternalContactResponse LookupExternalContact(const std::string& external_user_id) override;

 private:
  std::filesystem::path root_;

  std::filesystem::path PagePath(const std::string& session_id, std::size_t page) const;
};

} // namespace liveviewer::platform
