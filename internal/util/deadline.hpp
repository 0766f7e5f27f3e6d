#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace tracebrain::util {

/*
  Caller-supplied deadline carried by every externally triggered operation.
  A default-constructed Deadline never expires.
*/
class Deadline {
 public:
  using SteadyClock = std::chrono::steady_clock;

  Deadline() = default;
  explicit Deadline(SteadyClock::time_point at) : at_(at) {
  }

  static Deadline Never() {
    return {};
  }

  static Deadline After(std::chrono::milliseconds budget) {
    return Deadline(SteadyClock::now() + budget);
  }

  bool Expired() const {
    return at_ && SteadyClock::now() >= *at_;
  }

  // Time left, or nullopt when unbounded. Never negative.
  std::optional<std::chrono::milliseconds> Remaining() const {
    if (!at_) {
      return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*at_ - SteadyClock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

  void ThrowIfExpired(const std::string& operation) const {
    if (Expired()) {
      throw DeadlineExceeded("deadline exceeded during " + operation);
    }
  }

 private:
  std::optional<SteadyClock::time_point> at_;
};

} // namespace tracebrain::util
