#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "internal/auth/token_codec.hpp"
#include "internal/util/time.hpp"
#include "relay/v1/types.pb.h"

namespace relay::db {
class Repository;
class Transaction;
} // namespace relay::db

namespace relay::auth {

struct AuthOptions {
  std::string          secret_key;
  std::chrono::seconds access_ttl{std::chrono::hours(1)};
  std::chrono::seconds refresh_ttl{std::chrono::hours(24 * 7)};
  std::chrono::seconds pairing_ttl{std::chrono::minutes(10)};
  uint32_t             pbkdf2_iterations = 100000;
};

struct Identity {
  std::string     subject;
  relay::v1::Role role = relay::v1::ROLE_UNSPECIFIED;
  // The device itself for device tokens, the scoped device for controllers.
  std::string     device_id;
};

struct IssuedTokens {
  std::string access_token;
  std::string refresh_token;
  int64_t     expires_in_sec = 0;
};

struct PairingIssue {
  std::string     code;
  util::TimePoint expires_at;
};

struct RedeemedDevice {
  std::string  device_id;
  std::string  device_secret;
  IssuedTokens tokens;
};

struct ControllerCredentials {
  std::string  controller_id;
  IssuedTokens tokens;
};

/*
  AuthGate

  Pairing codes, device secrets and session tokens. Validation is pure;
  the only side effects are identity and secret store writes.

  Failures surface as util::AuthFailure subclasses so adapters can answer
  UNAUTHENTICATED before any session state exists.
*/
class AuthGate {
 public:
  // Produces candidate pairing codes; injectable for tests.
  using CodeGenerator = std::function<std::string()>;

  AuthGate(std::shared_ptr<db::Repository> repository, AuthOptions options, util::ClockFn clock = util::Now, CodeGenerator generator = {});

  // Throws AlreadyExists while the claim holds a live code.
  PairingIssue IssuePairingCode(const relay::v1::DeviceClaim& claim);

  // Throws InvalidOrExpiredCode.
  RedeemedDevice RedeemPairingCode(const std::string& code, const std::string& name, const relay::v1::DeviceInfo& info);

  // Throws TokenExpired / TokenInvalid.
  Identity VerifyAccessToken(const std::string& token) const;

  // Throws RefreshInvalid; only the access token is populated.
  IssuedTokens Refresh(const std::string& refresh_token);

  IssuedTokens LoginDevice(const std::string& device_id, const std::string& secret);

  ControllerCredentials RegisterController(const std::string& device_id, const std::string& name);

  void RevokeDevice(const std::string& device_id);

  std::string LookupPairing(const std::string& code);

  static std::string RandomPairingCode();

 private:
  std::string  MintAccessToken(const std::string& subject, relay::v1::Role role, const std::string& device_id, int64_t now_s) const;
  IssuedTokens MintTokens(db::Transaction& tx, const std::string& subject, relay::v1::Role role, const std::string& device_id, int64_t now_s);

  std::shared_ptr<db::Repository> repository_;
  AuthOptions                     options_;
  util::ClockFn                   clock_;
  CodeGenerator                   generator_;
  TokenCodec                      codec_;

  std::mutex redemption_mutex_;
};

} // namespace relay::auth
