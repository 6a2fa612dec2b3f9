#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace relay::auth {

/*
  Device secret storage.

  Secrets are hashed with PBKDF2-HMAC-SHA256 and a random 16 byte salt:

    pbkdf2_sha256$<iterations>$<salt base64>$<digest base64>
*/

std::string HashSecret(const std::string& secret, uint32_t iterations);

// Constant-time comparison; false for malformed encodings.
bool VerifySecret(const std::string& secret, const std::string& encoded);

// Cryptographically random bytes (RAND_bytes). Throws on RNG failure.
std::string RandomBytes(std::size_t count);

// 32 lowercase hex characters.
std::string GenerateDeviceSecret();

} // namespace relay::auth
