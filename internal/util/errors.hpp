#pragma once

#include <stdexcept>
#include <string>

namespace tracebrain::util {

/*
  Central error types.

  Core components throw these; the transport layer translates them to
  gRPC status codes (internal/grpc/grpc_error.cpp).
*/

// Malformed payload, unknown enum value, dangling parent or cycle.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg, std::string span_id = {})
      : std::runtime_error(span_id.empty() ? msg : msg + " (span_id=" + span_id + ")"), span_id_(std::move(span_id)) {
  }

  const std::string& span_id() const {
    return span_id_;
  }

 private:
  std::string span_id_;
};

class DanglingParent : public ValidationError {
 public:
  DanglingParent(const std::string& span_id, const std::string& parent_id)
      : ValidationError("DanglingParent: parent '" + parent_id + "' is not part of the trace", span_id) {
  }
};

class CycleDetected : public ValidationError {
 public:
  explicit CycleDetected(const std::string& span_id) : ValidationError("CycleDetected: parent chain revisits a span", span_id) {
  }
};

// A span id that already exists in the trace with different content.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg, std::string span_id = {})
      : std::runtime_error(span_id.empty() ? msg : msg + " (span_id=" + span_id + ")"), span_id_(std::move(span_id)) {
  }

  const std::string& span_id() const {
    return span_id_;
  }

 private:
  std::string span_id_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TranslationFailed : public std::runtime_error {
 public:
  explicit TranslationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProviderError : public std::runtime_error {
 public:
  explicit ProviderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit lost against a concurrent writer. Retryable.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tracebrain::util
