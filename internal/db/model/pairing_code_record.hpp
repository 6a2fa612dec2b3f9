#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

struct PairingCodeRecord {
  std::string code;
  std::string claim_id;
  std::string claim_name;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;

  bool        redeemed = false;
  std::string device_id;
};

} // namespace relay::db::model
