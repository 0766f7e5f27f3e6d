#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/deadline.hpp"

namespace tracebrain::llm {

struct RetryPolicy {
  uint32_t                  max_retries = 2;
  std::chrono::milliseconds backoff{500};
};

// Calls fn until it returns or throws something other than Retryable.
// Waits backoff * attempt between tries, never past the deadline. The last
// Retryable error is rethrown once retries are exhausted.
template <typename Retryable, typename Fn>
auto WithRetries(const RetryPolicy& policy, const util::Deadline& deadline, const std::string& operation, Fn&& fn) {
  for (uint32_t attempt = 0;; ++attempt) {
    deadline.ThrowIfExpired(operation);
    try {
      return fn(attempt);
    } catch (const Retryable& e) {
      if (attempt >= policy.max_retries) {
        throw;
      }
      TRACEBRAIN_LOG_WARN("retrying model call", {observability::StringField("operation", operation),
                                                  observability::IntField("attempt", attempt + 1),
                                                  observability::StringField("error", e.what())});
    }

    auto pause = policy.backoff * (attempt + 1);
    if (auto remaining = deadline.Remaining()) {
      pause = std::min(pause, *remaining);
    }
    std::this_thread::sleep_for(pause);
  }
}

} // namespace tracebrain::llm
