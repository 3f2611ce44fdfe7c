#include "identity_cache.hpp"

#include <mutex>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/platform/live_platform_api.hpp"
#include "internal/platform/payload_normalizer.hpp"

namespace liveviewer::ingest {

using observability::StringField;

std::string_view ToString(NameSource source) {
  switch (source) {
    case NameSource::kHost:
      return "host";
    case NameSource::kLocalStore:
      return "local_store";
    case NameSource::kApiPage:
      return "api_page";
    case NameSource::kRemoteLookup:
      return "remote_lookup";
    case NameSource::kFallback:
      return "fallback";
  }
  return "fallback";
}

IdentityCache::IdentityCache(std::string host_id, std::string host_name, std::shared_ptr<platform::LivePlatformApi> api)
    : host_id_(std::move(host_id)), host_name_(std::move(host_name)), api_(std::move(api)) {
}

void IdentityCache::PreloadLocal(const std::string& id, const std::string& name) {
  if (id.empty() || name.empty()) return;
  std::unique_lock lock(mutex_);
  local_[id] = name;
}

void IdentityCache::AddPageHints(const std::unordered_map<std::string, std::string>& hints) {
  if (hints.empty()) return;
  std::unique_lock lock(mutex_);
  for (const auto& [id, name] : hints) {
    if (!id.empty() && !name.empty()) page_[id] = name;
  }
}

std::optional<NameResolution> IdentityCache::Peek(const std::string& id) const {
  if (IsHost(id) && !host_name_.empty()) {
    return NameResolution{host_name_, true, NameSource::kHost};
  }

  std::shared_lock lock(mutex_);
  if (auto it = local_.find(id); it != local_.end()) {
    return NameResolution{it->second, true, NameSource::kLocalStore};
  }
  if (auto it = page_.find(id); it != page_.end()) {
    return NameResolution{it->second, true, NameSource::kApiPage};
  }
  if (auto it = remote_.find(id); it != remote_.end()) {
    return NameResolution{it->second, true, NameSource::kRemoteLookup};
  }
  return std::nullopt;
}

NameResolution IdentityCache::Resolve(const std::string& id) {
  if (auto hit = Peek(id)) return *hit;

  bool first_attempt = false;
  {
    std::unique_lock lock(mutex_);
    first_attempt = attempted_.insert(id).second;
  }

  if (first_attempt && api_) {
    if (auto name = LookupRemote(id)) {
      std::unique_lock lock(mutex_);
      remote_[id] = *name;
      return {*name, true, NameSource::kRemoteLookup};
    }
  }

  if (first_attempt) {
    LIVEVIEWER_LOG_WARN("identity resolution miss", {StringField("id", id)});
  }
  return {id, false, NameSource::kFallback};
}

std::optional<std::string> IdentityCache::LookupRemote(const std::string& id) {
  try {
    const auto user = api_->LookupUser(id);
    if (user.errcode() == 0 && !user.name().empty()) return user.name();

    const auto contact = api_->LookupExternalContact(id);
    if (contact.errcode() == 0 && !contact.external_contact().name().empty()) {
      return platform::CleanExternalName(contact.external_contact().name());
    }
  } catch (const platform::ApiError& e) {
    LIVEVIEWER_LOG_WARN("remote name lookup failed", {StringField("id", id), StringField("error", e.what())});
  }
  return std::nullopt;
}

std::unordered_map<std::string, std::string> IdentityCache::RemoteResolutions() const {
  std::shared_lock lock(mutex_);
  return remote_;
}

std::size_t IdentityCache::RemoteAttempts() const {
  std::shared_lock lock(mutex_);
  return attempted_.size();
}

} // namespace liveviewer::ingest
