#pragma once

#include <cstdint>
#include <string>

#include "relay/v1/types.pb.h"

namespace relay::db::model {

struct RefreshTokenRecord {
  std::string     jti;
  std::string     subject;
  relay::v1::Role role = relay::v1::ROLE_UNSPECIFIED;
  std::string     device_id;

  uint64_t issued_at_ms  = 0;
  uint64_t expires_at_ms = 0; // 0 = never

  bool revoked = false;
};

} // namespace relay::db::model
