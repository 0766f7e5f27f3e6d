#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace tracebrain::db {

/*
  Backend-neutral outcome of a repository write.

  SQLite result codes and pqxx exceptions are folded into ErrorCode by each
  backend; TraceStore maps ErrorCode onto the util:: exception types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // trace row missing
  AlreadyExists, // trace_id or (trace_id, span_id) taken
  Conflict,      // optimistic snapshot lost (memory backend)
  Busy,          // database locked

  ConstraintViolation, // e.g. a span for a trace that does not exist
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::SerializationFailure: return "serialization failure";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // A fresh transaction may succeed where this one failed.
  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace tracebrain::db
