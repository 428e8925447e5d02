#pragma once

#include <string>
#include <utility>

namespace depgraph::db {

// Outcome of a write against the publication log. Backends map their own
// error types onto these before returning.
enum class ErrorCode {
  OK = 0,
  AlreadyExists,       // (contract_id, version_label) or epoch already logged
  OutOfOrder,          // epoch not above the last logged one
  ConstraintViolation,
  Conflict,            // lost a race with a concurrent transaction
  Busy,
  IOError,
  Corruption,
  InternalError,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::OutOfOrder: return "out_of_order";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal";
  }
  return "unknown";
}

struct [[nodiscard]] Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() { return {}; }
  static Result Err(ErrorCode code, std::string message = {}) { return {code, std::move(message)}; }

  explicit operator bool() const { return code == ErrorCode::OK; }
};

} // namespace depgraph::db
