#pragma once

#include <cstdint>
#include <string>

#include "relay/v1/types.pb.h"

namespace relay::db::model {

struct CommandRecord {
  std::string id;
  std::string device_id;
  std::string action;
  std::string params_json = "{}";

  relay::v1::CommandStatus status = relay::v1::COMMAND_STATUS_PENDING;

  uint64_t created_at_ms   = 0;
  uint64_t delivered_at_ms = 0;
  uint64_t completed_at_ms = 0;

  std::string error;

  // Assigned by the repository on insert; FIFO tie-breaker.
  uint64_t sequence = 0;
};

} // namespace relay::db::model
