#pragma once

#include <string>

#include "relay/v1/token.pb.h"

namespace relay::auth {

/*
  HS256 JSON Web Tokens.

    base64url(header) . base64url(claims) . base64url(HMAC-SHA256)

  Claims are the registered names (sub, iat, exp, jti) plus "type"
  ("device" | "controller"), "refresh" and "device_id". Decode verifies the
  signature and shape only; expiry is the caller's concern.
*/
class TokenCodec {
 public:
  explicit TokenCodec(std::string secret_key);

  std::string Encode(const relay::v1::TokenClaims& claims) const;

  // Throws util::TokenInvalid.
  relay::v1::TokenClaims Decode(const std::string& token) const;

 private:
  std::string Sign(const std::string& signing_input) const;

  std::string secret_key_;
};

} // namespace relay::auth
