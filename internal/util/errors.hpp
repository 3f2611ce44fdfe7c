#pragma once

#include <stdexcept>
#include <string>

namespace liveviewer::util {

/*
  Central error types.

  These never cross the ingestion / reward boundary; the coordinators
  translate them into structured outcomes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Repository write failed; carries the backend message.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace liveviewer::util
