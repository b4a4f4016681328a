#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatstore {

using json = nlohmann::json;

// Type aliases
using ConversationId = std::string;
using MessageId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Sibling choice per decision point, e.g. {0, 1} selects version 1 at the
// second edited user message. Trailing zeros are implicit.
using BranchCoordinate = std::vector<int>;

// Error taxonomy shared by every store operation
enum class ErrorCode {
  NotFound,         // Conversation or required record absent
  InvalidArgument,  // Position / decision index out of range
  Corrupt,          // On-disk JSON failed to parse
  IOFailure         // Disk write failed, data for the operation is lost
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::IOFailure;
  std::string message;

  std::string describe() const {
    return to_string(code) + ": " + message;
  }
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  ErrorCode code() const {
    return error ? error->code : ErrorCode::IOFailure;
  }

  T &operator*() {
    return *value;
  }

  const T &operator*() const {
    return *value;
  }

  T *operator->() {
    return &*value;
  }

  const T *operator->() const {
    return &*value;
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }

  static Result failure(ErrorCode code, std::string message) {
    return Result{std::nullopt, Error{code, std::move(message)}};
  }
};

// Outcome of an operation with no value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  ErrorCode code() const {
    return error ? error->code : ErrorCode::IOFailure;
  }

  static Status success() {
    return Status{};
  }

  static Status failure(Error err) {
    return Status{std::move(err)};
  }

  static Status failure(ErrorCode code, std::string message) {
    return Status{Error{code, std::move(message)}};
  }

  // Carry a failed Result's error through a Status-returning path
  template <typename T>
  static Status from(const Result<T> &result) {
    return result.failed() ? Status{result.error} : Status{};
  }

  template <typename T>
  Result<T> as_failure() const {
    return Result<T>::failure(*error);
  }
};

// ISO-8601 UTC with microseconds, e.g. 2025-01-01T12:00:00.000000
std::string format_timestamp(const Timestamp &ts);

// Accepts the format above (fraction optional) and bare epoch seconds
Timestamp parse_timestamp(const json &j);

// Lowercase ASCII letters, other bytes untouched
std::string to_lower_ascii(const std::string &input);

}  // namespace chatstore
