#pragma once

#include <string>
#include <string_view>

namespace relay::util {

// RFC 4648 base64; the url variant is unpadded (JWT segments).
std::string Base64Encode(std::string_view raw);
std::string Base64Decode(std::string_view encoded);

std::string Base64UrlEncode(std::string_view raw);
std::string Base64UrlDecode(std::string_view encoded);

} // namespace relay::util
