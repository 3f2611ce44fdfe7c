#pragma once

#include <string>

#include "liveviewer/platform/v1.hpp"

namespace liveviewer::platform {

// JSON body -> wire message. Unknown keys are ignored; malformed bodies throw ApiError.
wire::WatchStatResponse       ParseWatchStatResponse(const std::string& json);
wire::UserInfoResponse        ParseUserInfoResponse(const std::string& json);
wire::ExternalContactResponse ParseExternalContactResponse(const std::string& json);

} // namespace liveviewer::platform
