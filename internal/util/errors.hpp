#pragma once

#include <stdexcept>
#include <string>

namespace ridedispatch::util {

/*
  Central error types.

  Rule violations inside the engine are reported as outcome enums; these are
  raised by the service layer (and by the engine for bad input) and translated
  to gRPC status codes by grpc::ToStatus.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// precondition failed: the entity exists but is in the wrong state
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// caller is not a participant of the entity it acts on
class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// transient: store unreachable, lease busy, retry later
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ridedispatch::util
