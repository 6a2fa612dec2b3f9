#pragma once

#include <string>
#include <string_view>

namespace relay::db {

/*
  Backend-neutral outcome of a repository write.

  Backends translate sqlite rc / pqxx exceptions into these codes so the
  relay core never sees driver error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // update or lookup of a missing row
  AlreadyExists, // primary or unique key taken

  ConstraintViolation, // e.g. a command for a device row that does not exist
  SerializationFailure,
  Busy,

  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Raises the relay::util error matching result.code; no-op on OK.
// `what` names the write for the message ("insert device").
void ThrowIfError(const Result& result, std::string_view what);

} // namespace relay::db
