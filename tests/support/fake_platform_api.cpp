#include "fake_platform_api.hpp"

#include <thread>
#include <utility>

namespace liveviewer::testing {

using namespace liveviewer::platform;

void FakePlatformApi::AddPage(const std::string& session_id, std::vector<wire::WatchStatUser> users,
                              std::vector<wire::WatchStatExternalUser> external) {
  wire::WatchStatResponse page;
  for (auto& u : users) *page.mutable_stat_info()->add_users() = std::move(u);
  for (auto& u : external) *page.mutable_stat_info()->add_external_users() = std::move(u);

  std::lock_guard lock(mutex_);
  pages_[session_id].push_back(std::move(page));
}

void FakePlatformApi::FailPage(const std::string& session_id, int page, int errcode) {
  std::lock_guard lock(mutex_);
  failing_[session_id][page] = errcode;
}

void FakePlatformApi::BreakPage(const std::string& session_id, int page) {
  std::lock_guard lock(mutex_);
  broken_[session_id][page] = true;
}

void FakePlatformApi::SetUser(const std::string& id, const std::string& name) {
  std::lock_guard lock(mutex_);
  users_[id] = name;
}

void FakePlatformApi::SetContact(const std::string& id, const std::string& name) {
  std::lock_guard lock(mutex_);
  contacts_[id] = name;
}

wire::WatchStatResponse FakePlatformApi::GetWatchStatistics(const std::string& session_id, const std::string& cursor) {
  ++page_requests_;
  std::lock_guard lock(mutex_);

  int n = 1;
  if (!cursor.empty()) {
    if (cursor.size() < 2 || cursor[0] != 'p') throw ApiError("bad cursor " + cursor);
    n = std::stoi(cursor.substr(1));
  }

  if (broken_[session_id][n]) throw ApiError("connection reset on page " + std::to_string(n));

  if (auto it = failing_[session_id].find(n); it != failing_[session_id].end()) {
    wire::WatchStatResponse error;
    error.set_errcode(it->second);
    error.set_errmsg("simulated failure");
    return error;
  }

  const auto& pages = pages_[session_id];
  if (n < 1 || n > static_cast<int>(pages.size())) {
    if (pages.empty() && n == 1) {
      wire::WatchStatResponse empty;
      empty.set_ending(1);
      return empty;
    }
    throw ApiError("no page " + std::to_string(n));
  }

  auto page = pages[n - 1];
  if (n == static_cast<int>(pages.size())) {
    page.set_ending(1);
    page.clear_next_key();
  } else {
    page.set_ending(0);
    page.set_next_key("p" + std::to_string(n + 1));
  }
  return page;
}

wire::UserInfoResponse FakePlatformApi::LookupUser(const std::string& user_id) {
  ++user_lookups_;
  std::this_thread::sleep_for(std::chrono::milliseconds(lookup_delay_ms_.load()));
  std::lock_guard lock(mutex_);
  ++lookups_by_id_[user_id];

  wire::UserInfoResponse resp;
  if (auto it = users_.find(user_id); it != users_.end()) {
    resp.set_userid(user_id);
    resp.set_name(it->second);
  } else {
    resp.set_errcode(60111);
    resp.set_errmsg("invalid userid");
  }
  return resp;
}

wire::ExternalContactResponse FakePlatformApi::LookupExternalContact(const std::string& external_user_id) {
  ++contact_lookups_;
  std::this_thread::sleep_for(std::chrono::milliseconds(lookup_delay_ms_.load()));
  std::lock_guard lock(mutex_);
  ++lookups_by_id_[external_user_id];

  wire::ExternalContactResponse resp;
  if (auto it = contacts_.find(external_user_id); it != contacts_.end()) {
    resp.mutable_external_contact()->set_external_userid(external_user_id);
    resp.mutable_external_contact()->set_name(it->second);
  } else {
    resp.set_errcode(84061);
    resp.set_errmsg("not external contact");
  }
  return resp;
}

int FakePlatformApi::LookupsFor(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto it = lookups_by_id_.find(id);
  return it == lookups_by_id_.end() ? 0 : it->second;
}

} // namespace liveviewer::testing
