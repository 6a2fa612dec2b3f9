#include <cassert>
#include <iostream>
#include <string>

#include "internal/auth/secret_hasher.hpp"
#include "internal/auth/token_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::auth::TokenCodec;
using relay::v1::TokenClaims;

TokenClaims ControllerClaims() {
  TokenClaims claims;
  claims.set_sub("controller-7");
  claims.set_role(relay::v1::ROLE_CONTROLLER);
  claims.set_iat(1'700'000'000);
  claims.set_exp(1'700'003'600);
  claims.set_jti("jti-1");
  claims.set_device_id("dev-1");
  return claims;
}

template <typename Fn>
bool ThrowsTokenInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const relay::util::TokenInvalid&) {
    return true;
  }
  return false;
}

void TestEncodedClaimsDecodeWithSameKey() {
  TokenCodec codec("unit-test-key");
  const auto token   = codec.Encode(ControllerClaims());
  const auto decoded = codec.Decode(token);

  assert(decoded.sub() == "controller-7");
  assert(decoded.role() == relay::v1::ROLE_CONTROLLER);
  assert(decoded.iat() == 1'700'000'000);
  assert(decoded.exp() == 1'700'003'600);
  assert(decoded.jti() == "jti-1");
  assert(decoded.device_id() == "dev-1");
  assert(!decoded.refresh());
}

void TestForeignKeyIsRejected() {
  TokenCodec issuer("key-a");
  TokenCodec verifier("key-b");
  const auto token = issuer.Encode(ControllerClaims());
  assert(ThrowsTokenInvalid([&] { (void)verifier.Decode(token); }));
}

void TestTamperedPayloadIsRejected() {
  TokenCodec codec("unit-test-key");
  auto       token = codec.Encode(ControllerClaims());

  const auto first = token.find('.');
  token[first + 2] = token[first + 2] == 'A' ? 'B' : 'A';
  assert(ThrowsTokenInvalid([&] { (void)codec.Decode(token); }));
}

void TestMalformedTokensAreRejected() {
  TokenCodec codec("unit-test-key");
  assert(ThrowsTokenInvalid([&] { (void)codec.Decode(""); }));
  assert(ThrowsTokenInvalid([&] { (void)codec.Decode("no-dots-at-all"); }));
  assert(ThrowsTokenInvalid([&] { (void)codec.Decode("a.b"); }));
  assert(ThrowsTokenInvalid([&] { (void)codec.Decode("a.b.c.d"); }));
  assert(ThrowsTokenInvalid([&] { (void)codec.Decode("!!.??.**"); }));
}

void TestSecretHashVerifies() {
  const auto encoded = relay::auth::HashSecret("correct horse", 1000);
  assert(encoded.rfind("pbkdf2_sha256$1000$", 0) == 0);
  assert(relay::auth::VerifySecret("correct horse", encoded));
  assert(!relay::auth::VerifySecret("wrong horse", encoded));
  assert(!relay::auth::VerifySecret("correct horse", "not-an-encoding"));
  assert(!relay::auth::VerifySecret("correct horse", "pbkdf2_sha256$x$y$z"));

  // Salted: the same secret never encodes twice the same way.
  assert(relay::auth::HashSecret("correct horse", 1000) != encoded);
}

void TestDeviceSecretShape() {
  const auto secret = relay::auth::GenerateDeviceSecret();
  assert(secret.size() == 32);
  for (char c : secret) {
    assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
  assert(relay::auth::GenerateDeviceSecret() != secret);
}

} // namespace

int main() {
  TestEncodedClaimsDecodeWithSameKey();
  TestForeignKeyIsRejected();
  TestTamperedPayloadIsRejected();
  TestMalformedTokensAreRejected();
  TestSecretHashVerifies();
  TestDeviceSecretShape();

  std::cout << "relay_unit_token_codec: pass\n";
  return 0;
}
