#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace relay::db {

void ThrowIfError(const Result& result, std::string_view what) {
  if (result) {
    return;
  }

  auto message = std::string(what);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace relay::db
