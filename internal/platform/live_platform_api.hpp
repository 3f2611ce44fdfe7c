#pragma once

#include <stdexcept>
#include <string>

#include "liveviewer/platform/v1.hpp"

namespace liveviewer::platform {

// Transport-level failure (unreachable endpoint, unreadable body).
// Application errors come back as a non-zero errcode instead.
class ApiError : public std::runtime_error {
 public:
  explicit ApiError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  External live platform.

  Implementations must be safe to call from several threads: the
  collector pages while reconcilers perform remote name lookups.
*/
class LivePlatformApi {
 public:
  virtual ~LivePlatformApi() = default;

  // Empty cursor requests the first page.
  virtual wire::WatchStatResponse GetWatchStatistics(const std::string& session_id, const std::string& cursor) = 0;

  virtual wire::UserInfoResponse LookupUser(const std::string& user_id) = 0;

  virtual wire::ExternalContactResponse LookupExternalContact(const std::string& external_user_id) = 0;
};

} // namespace liveviewer::platform
