#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "internal/model/participant.hpp"

namespace liveviewer::platform {
class LivePlatformApi;
}

namespace liveviewer::ingest {

enum class NameSource {
  kHost,
  kLocalStore,
  kApiPage,
  kRemoteLookup,
  kFallback,
};

std::string_view ToString(NameSource source);

struct NameResolution {
  std::string name;
  bool        found  = false;
  NameSource  source = NameSource::kFallback;
};

/*
  Raw participant id -> display name, for the lifetime of one run.

  Resolution order:
    1. session host
    2. local store preload (existing viewers, inviter cache)
    3. names seen on statistics pages
    4. one remote lookup per id per run (member directory, then contacts)
    5. the id itself (found = false)

  Reads take a shared lock; remote calls run without any lock held.
*/
class IdentityCache {
 public:
  IdentityCache(std::string host_id, std::string host_name, std::shared_ptr<platform::LivePlatformApi> api);

  void PreloadLocal(const std::string& id, const std::string& name);
  void AddPageHints(const std::unordered_map<std::string, std::string>& hints);

  NameResolution Resolve(const std::string& id);

  // Steps 1-3 only; never calls the platform.
  std::optional<NameResolution> Peek(const std::string& id) const;

  bool IsHost(const std::string& id) const {
    return !host_id_.empty() && id == host_id_;
  }

  const std::string& HostName() const {
    return host_name_;
  }

  // Names obtained from the platform during this run.
  std::unordered_map<std::string, std::string> RemoteResolutions() const;

  std::size_t RemoteAttempts() const;

 private:
  std::optional<std::string> LookupRemote(const std::string& id);

  const std::string                          host_id_;
  const std::string                          host_name_;
  std::shared_ptr<platform::LivePlatformApi> api_;

  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, std::string> local_;
  std::unordered_map<std::string, std::string> page_;
  std::unordered_map<std::string, std::string> remote_;
  std::unordered_set<std::string>              attempted_;
};

} // namespace liveviewer::ingest
