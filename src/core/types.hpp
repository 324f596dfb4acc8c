#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace conductor {

// Application-level session identifier, stable across agent restarts
using SessionId = std::string;

// Value-or-error result used as the completion currency of async operations
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value() && !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string err) {
    Result r;
    r.error = std::move(err);
    return r;
  }
};

template <>
struct Result<void> {
  bool succeeded = false;
  std::optional<std::string> error;

  bool ok() const {
    return succeeded && !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success() {
    Result r;
    r.succeeded = true;
    return r;
  }

  static Result failure(std::string err) {
    Result r;
    r.error = std::move(err);
    return r;
  }
};

// UUID generation (v4, random)
class UUID {
 public:
  static std::string generate();
};

}  // namespace conductor
