#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/registry/connection_registry.hpp"
#include "internal/util/time.hpp"
#include "relay/v1/types.pb.h"

namespace relay::db {
class Repository;
namespace model {
struct DeviceRecord;
}
} // namespace relay::db

namespace relay::queue {
class CommandQueue;
}

namespace relay::presence {

/*
  PresenceTracker

  Derives ONLINE/OFFLINE from registry events and tells the controllers
  watching the device. Also keeps the latest status report.

  Persistence is best-effort: a repository failure is logged and the
  broadcast still goes out.
*/
class PresenceTracker final : public registry::RegistryObserver {
 public:
  PresenceTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::ConnectionRegistry> registry,
                  std::shared_ptr<queue::CommandQueue> queue, util::ClockFn clock = util::Now);

  void OnDeviceAdmitted(const std::shared_ptr<registry::Session>& session, bool superseded) override;
  void OnDeviceRemoved(const std::shared_ptr<registry::Session>& session) override;

  // Stores the report, refreshes last-seen and forwards to controllers.
  void RecordStatus(const std::string& device_id, const relay::v1::StatusReport& report);

  void Touch(const std::string& device_id);

  // Throws NotFound.
  relay::v1::DeviceStatus Snapshot(const std::string& device_id) const;

  // Marks every device OFFLINE; no session survives a restart.
  std::size_t ResetAllOffline();

  static relay::v1::DeviceStatus ToDeviceStatus(const db::model::DeviceRecord& record);

 private:
  struct Transition {
    relay::v1::Presence     presence     = relay::v1::PRESENCE_OFFLINE;
    uint64_t                last_seen_ms = 0;
    relay::v1::StatusReport report;
    bool                    has_report = false;
  };

  // Persists presence/last-seen (and the report when given). Never throws.
  Transition Persist(const std::string& device_id, std::optional<relay::v1::Presence> presence, const relay::v1::StatusReport* report);

  void Broadcast(const std::string& device_id, const Transition& transition) const;

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<registry::ConnectionRegistry> registry_;
  std::shared_ptr<queue::CommandQueue>          queue_;
  util::ClockFn                                 clock_;
};

} // namespace relay::presence
