#include "secret_hasher.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace relay::auth {

namespace {

constexpr const char*  kScheme       = "pbkdf2_sha256";
constexpr std::size_t  kSaltBytes    = 16;
constexpr std::size_t  kDigestBytes  = 32;

std::string Derive(const std::string& secret, const std::string& salt, uint32_t iterations) {
  std::string digest(kDigestBytes, '\0');
  if (PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()), reinterpret_cast<const unsigned char*>(salt.data()),
                        static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(), static_cast<int>(digest.size()),
                        reinterpret_cast<unsigned char*>(digest.data())) != 1) {
    throw std::runtime_error("PBKDF2 derivation failed");
  }
  return digest;
}

std::vector<std::string> Split(const std::string& value, char sep) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  for (;;) {
    const auto pos = value.find(sep, start);
    parts.push_back(value.substr(start, pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return parts;
}

} // namespace

std::string RandomBytes(std::size_t count) {
  std::string out(count, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

std::string GenerateDeviceSecret() {
  static constexpr char kHex[] = "0123456789abcdef";
  const auto            raw    = RandomBytes(16);
  std::string           out;
  out.reserve(32);
  for (unsigned char b : raw) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string HashSecret(const std::string& secret, uint32_t iterations) {
  if (iterations == 0) {
    throw std::invalid_argument("PBKDF2 iteration count must be positive");
  }
  const auto salt = RandomBytes(kSaltBytes);
  return std::string(kScheme) + "$" + std::to_string(iterations) + "$" + util::Base64Encode(salt) + "$" + util::Base64Encode(Derive(secret, salt, iterations));
}

bool VerifySecret(const std::string& secret, const std::string& encoded) {
  const auto parts = Split(encoded, '$');
  if (parts.size() != 4 || parts[0] != kScheme) {
    return false;
  }

  uint32_t    iterations = 0;
  std::string salt;
  std::string expected;
  try {
    const auto parsed = std::stoul(parts[1]);
    if (parsed == 0 || parsed > 10'000'000) return false;
    iterations = static_cast<uint32_t>(parsed);
    salt       = util::Base64Decode(parts[2]);
    expected   = util::Base64Decode(parts[3]);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  } catch (const util::InvalidArgument&) {
    return false;
  }

  const auto actual = Derive(secret, salt, iterations);
  return actual.size() == expected.size() && CRYPTO_memcmp(actual.data(), expected.data(), actual.size()) == 0;
}

} // namespace relay::auth
