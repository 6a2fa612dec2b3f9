#include "base64.hpp"

#include <openssl/evp.h>

#include <vector>

#include "errors.hpp"

namespace relay::util {

std::string Base64Encode(std::string_view raw) {
  std::string out(4 * ((raw.size() + 2) / 3), '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(raw.data()),
                                        static_cast<int>(raw.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string Base64Decode(std::string_view encoded) {
  if (encoded.size() % 4 != 0) {
    throw InvalidArgument("base64: length is not a multiple of 4");
  }
  if (encoded.empty()) {
    return {};
  }

  std::vector<unsigned char> out(3 * encoded.size() / 4);
  const int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()), static_cast<int>(encoded.size()));
  if (decoded < 0) {
    throw InvalidArgument("base64: invalid input");
  }

  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
  std::size_t length = static_cast<std::size_t>(decoded);
  if (encoded.back() == '=') --length;
  if (encoded.size() > 1 && encoded[encoded.size() - 2] == '=') --length;
  return std::string(reinterpret_cast<const char*>(out.data()), length);
}

std::string Base64UrlEncode(std::string_view raw) {
  auto out = Base64Encode(raw);
  for (auto& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!out.empty() && out.back() == '=') out.pop_back();
  return out;
}

std::string Base64UrlDecode(std::string_view encoded) {
  std::string padded(encoded);
  for (auto& c : padded) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
    else if (c == '+' || c == '/' || c == '=') throw InvalidArgument("base64url: invalid character");
  }
  if (padded.size() % 4 == 1) {
    throw InvalidArgument("base64url: invalid length");
  }
  while (padded.size() % 4 != 0) padded.push_back('=');
  return Base64Decode(padded);
}

} // namespace relay::util
