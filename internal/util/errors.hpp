#pragma once

#include <stdexcept>
#include <string>

namespace relay::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Authentication failures. All of them map to UNAUTHENTICATED and are raised
  before any session state is touched.
*/
class AuthFailure : public std::runtime_error {
 public:
  explicit AuthFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidOrExpiredCode : public AuthFailure {
 public:
  explicit InvalidOrExpiredCode(const std::string& msg) : AuthFailure(msg) {
  }
};

class TokenExpired : public AuthFailure {
 public:
  explicit TokenExpired(const std::string& msg) : AuthFailure(msg) {
  }
};

class TokenInvalid : public AuthFailure {
 public:
  explicit TokenInvalid(const std::string& msg) : AuthFailure(msg) {
  }
};

class RefreshInvalid : public AuthFailure {
 public:
  explicit RefreshInvalid(const std::string& msg) : AuthFailure(msg) {
  }
};

// Acknowledgment for a command id the device does not own, or an
// out-of-order status transition.
class UnknownCommand : public std::runtime_error {
 public:
  explicit UnknownCommand(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedMessage : public std::runtime_error {
 public:
  explicit MalformedMessage(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProtocolAbuse : public std::runtime_error {
 public:
  explicit ProtocolAbuse(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace relay::util
