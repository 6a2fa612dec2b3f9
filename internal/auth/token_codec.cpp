#include "token_codec.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cmath>
#include <stdexcept>

#include <google/protobuf/struct.pb.h>

#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace relay::auth {

namespace {

constexpr const char* kHeaderJson = R"({"alg":"HS256","typ":"JWT"})";

std::string RoleName(relay::v1::Role role) {
  switch (role) {
    case relay::v1::ROLE_DEVICE:
      return "device";
    case relay::v1::ROLE_CONTROLLER:
      return "controller";
    default:
      throw std::invalid_argument("token role must be device or controller");
  }
}

relay::v1::Role ParseRole(const std::string& name) {
  if (name == "device") return relay::v1::ROLE_DEVICE;
  if (name == "controller") return relay::v1::ROLE_CONTROLLER;
  throw util::TokenInvalid("unknown token type");
}

const google::protobuf::Value* Field(const google::protobuf::Struct& s, const char* key, google::protobuf::Value::KindCase kind) {
  auto it = s.fields().find(key);
  if (it == s.fields().end()) return nullptr;
  if (it->second.kind_case() != kind) throw util::TokenInvalid(std::string("claim has wrong type: ") + key);
  return &it->second;
}

int64_t NumericClaim(const google::protobuf::Struct& s, const char* key, bool required) {
  const auto* v = Field(s, key, google::protobuf::Value::kNumberValue);
  if (!v) {
    if (required) throw util::TokenInvalid(std::string("missing claim: ") + key);
    return 0;
  }
  const double n = v->number_value();
  if (!std::isfinite(n) || n < 0 || n != std::floor(n)) throw util::TokenInvalid(std::string("invalid claim: ") + key);
  return static_cast<int64_t>(n);
}

std::string StringClaim(const google::protobuf::Struct& s, const char* key, bool required) {
  const auto* v = Field(s, key, google::protobuf::Value::kStringValue);
  if (!v) {
    if (required) throw util::TokenInvalid(std::string("missing claim: ") + key);
    return {};
  }
  return v->string_value();
}

std::string DecodeSegment(const std::string& segment) {
  try {
    return util::Base64UrlDecode(segment);
  } catch (const util::InvalidArgument& e) {
    throw util::TokenInvalid(std::string("malformed token: ") + e.what());
  }
}

google::protobuf::Struct ParseSegment(const std::string& json) {
  try {
    return util::ParseStruct(json);
  } catch (const util::InvalidArgument& e) {
    throw util::TokenInvalid(std::string("malformed token: ") + e.what());
  }
}

} // namespace

TokenCodec::TokenCodec(std::string secret_key) : secret_key_(std::move(secret_key)) {
  if (secret_key_.empty()) {
    throw std::invalid_argument("token signing key must not be empty");
  }
}

std::string TokenCodec::Sign(const std::string& signing_input) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (!HMAC(EVP_sha256(), secret_key_.data(), static_cast<int>(secret_key_.size()), reinterpret_cast<const unsigned char*>(signing_input.data()),
            signing_input.size(), digest, &digest_len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string TokenCodec::Encode(const relay::v1::TokenClaims& claims) const {
  google::protobuf::Struct payload;
  auto&                    fields = *payload.mutable_fields();
  fields["sub"].set_string_value(claims.sub());
  fields["type"].set_string_value(RoleName(claims.role()));
  fields["iat"].set_number_value(static_cast<double>(claims.iat()));
  if (claims.exp() > 0) fields["exp"].set_number_value(static_cast<double>(claims.exp()));
  if (!claims.jti().empty()) fields["jti"].set_string_value(claims.jti());
  if (claims.refresh()) fields["refresh"].set_bool_value(true);
  if (!claims.device_id().empty()) fields["device_id"].set_string_value(claims.device_id());

  const auto signing_input = util::Base64UrlEncode(kHeaderJson) + "." + util::Base64UrlEncode(util::ToJson(payload));
  return signing_input + "." + util::Base64UrlEncode(Sign(signing_input));
}

relay::v1::TokenClaims TokenCodec::Decode(const std::string& token) const {
  const auto first = token.find('.');
  const auto last  = token.rfind('.');
  if (first == std::string::npos || first == last || token.find('.', first + 1) != last) {
    throw util::TokenInvalid("malformed token: expected three segments");
  }

  const auto signing_input = token.substr(0, last);
  const auto signature     = DecodeSegment(token.substr(last + 1));
  const auto expected      = Sign(signing_input);
  if (signature.size() != expected.size() || CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    throw util::TokenInvalid("token signature mismatch");
  }

  const auto header = ParseSegment(DecodeSegment(token.substr(0, first)));
  if (StringClaim(header, "alg", true) != "HS256") {
    throw util::TokenInvalid("unsupported token algorithm");
  }

  const auto payload = ParseSegment(DecodeSegment(token.substr(first + 1, last - first - 1)));

  relay::v1::TokenClaims claims;
  claims.set_sub(StringClaim(payload, "sub", true));
  claims.set_role(ParseRole(StringClaim(payload, "type", true)));
  claims.set_iat(NumericClaim(payload, "iat", true));
  claims.set_exp(NumericClaim(payload, "exp", false));
  claims.set_jti(StringClaim(payload, "jti", false));
  claims.set_device_id(StringClaim(payload, "device_id", false));
  if (const auto* refresh = Field(payload, "refresh", google::protobuf::Value::kBoolValue)) {
    claims.set_refresh(refresh->bool_value());
  }

  if (claims.sub().empty()) {
    throw util::TokenInvalid("empty token subject");
  }
  return claims;
}

} // namespace relay::auth
