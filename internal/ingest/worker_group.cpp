#include "worker_group.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace liveviewer::ingest {

WorkerGroup::~WorkerGroup() {
  JoinAll();
}

void WorkerGroup::Spawn(std::string name, std::function<void()> fn) {
  threads_.emplace_back([this, name = std::move(name), fn = std::move(fn)] {
    try {
      fn();
    } catch (const std::exception& e) {
      Record(name, std::current_exception(), e.what());
    } catch (...) {
      Record(name, std::current_exception(), "non-standard exception");
    }
  });
}

void WorkerGroup::JoinAll() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

std::vector<WorkerGroup::Failure> WorkerGroup::Failures() const {
  std::lock_guard lock(mutex_);
  return failures_;
}

void WorkerGroup::Record(const std::string& name, std::exception_ptr error, std::string message) {
  LIVEVIEWER_LOG_ERROR("worker failed", {observability::StringField("worker", name),
                                         observability::StringField("error", message)});
  std::lock_guard lock(mutex_);
  failures_.push_back({name, std::move(message), std::move(error)});
}

} // namespace liveviewer::ingest
