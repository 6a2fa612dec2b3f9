#pragma once

#include <cstdint>
#include <string>

#include "relay/v1/types.pb.h"

namespace relay::db::model {

/*
  Persistent device row.

  Devices are never deleted; unpairing clears `paired`.
  presence/last_seen_ms are written only by the presence tracker.
*/

struct DeviceRecord {
  std::string id;
  std::string name;

  // "pbkdf2_sha256$<iterations>$<salt b64>$<hash b64>"
  std::string secret_hash;

  // JSON objects (DeviceInfo, StatusReport, free-form settings)
  std::string info_json;
  std::string status_json;
  std::string settings_json = "{}";

  relay::v1::Presence presence = relay::v1::PRESENCE_OFFLINE;

  uint64_t last_seen_ms  = 0;
  uint64_t created_at_ms = 0;

  bool paired = true;
};

} // namespace relay::db::model
