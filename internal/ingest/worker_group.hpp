#pragma once

#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace liveviewer::ingest {

/*
  Named threads joined together.

  An exception escaping a worker is captured with the worker's name and
  reported after JoinAll(); it never terminates the process.
*/
class WorkerGroup {
 public:
  struct Failure {
    std::string        worker;
    std::string        message;
    std::exception_ptr error;
  };

  WorkerGroup() = default;
  ~WorkerGroup();

  WorkerGroup(const WorkerGroup&)            = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  void Spawn(std::string name, std::function<void()> fn);

  void JoinAll();

  // Valid after JoinAll().
  std::vector<Failure> Failures() const;

 private:
  void Record(const std::string& name, std::exception_ptr error, std::string message);

  std::vector<std::thread> threads_;
  mutable std::mutex       mutex_;
  std::vector<Failure>     failures_;
};

} // namespace liveviewer::ingest
