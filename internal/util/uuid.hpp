#pragma once

#include <string>

namespace relay::util {

// Fresh RFC4122 v4 id in canonical 8-4-4-4-12 form. Used for device,
// controller, command and session ids and for token jti values, so the
// bytes come from the OpenSSL CSPRNG. Throws if it cannot be seeded.
std::string NewId();

} // namespace relay::util
