#include "wire_json.hpp"

#include <google/protobuf/util/json_util.h>

#include "live_platform_api.hpp"

namespace liveviewer::platform {
namespace {

template <typename Message>
Message ParseBody(const std::string& json, const char* what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw ApiError(std::string("malformed ") + what + " body: " + std::string(status.message()));
  }
  return message;
}

} // namespace

wire::WatchStatResponse ParseWatchStatResponse(const std::string& json) {
  return ParseBody<wire::WatchStatResponse>(json, "watch statistics");
}

wire::UserInfoResponse ParseUserInfoResponse(const std::string& json) {
  return ParseBody<wire::UserInfoResponse>(json, "user info");
}

wire::ExternalContactResponse ParseExternalContactResponse(const std::string& json) {
  return ParseBody<wire::ExternalContactResponse>(json, "external contact");
}

} // namespace liveviewer::platform
