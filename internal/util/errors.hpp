#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace depgraph::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// (contract_id, version_label) was already published.
class DuplicateVersion : public AlreadyExists {
 public:
  explicit DuplicateVersion(const std::string& msg) : AlreadyExists(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Request is structurally incomplete (missing ids, bad depth).
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedInterface : public std::runtime_error {
 public:
  explicit MalformedInterface(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Publishing would close a cycle.

  Path() holds version node ids ("contract@version") starting and ending
  at the version being published.
*/
class CycleDetected : public std::runtime_error {
 public:
  CycleDetected(const std::string& msg, std::vector<std::string> path) : std::runtime_error(msg), path_(std::move(path)) {
  }

  const std::vector<std::string>& Path() const {
    return path_;
  }

 private:
  std::vector<std::string> path_;
};

} // namespace depgraph::util
