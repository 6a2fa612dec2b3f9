#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/command_record.hpp"
#include "internal/util/time.hpp"
#include "relay/v1/types.pb.h"

namespace relay::db {
class Repository;
}

namespace relay::registry {
class ConnectionRegistry;
}

namespace relay::queue {

struct CommandPage {
  std::vector<relay::v1::Command> commands;
  uint64_t                        total = 0;
};

/*
  CommandQueue

  Per-device FIFO of PENDING commands plus the DELIVERED/EXECUTING commands
  still waiting for a terminal acknowledgment.

  Every command is persisted before it is queued and every transition is
  persisted as it happens, so Hydrate() rebuilds the exact queue after a
  restart. Delivery is at-most-once: a DELIVERED command is never queued
  again.

  All operations on one device are serialized by that device's mutex.
*/
class CommandQueue {
 public:
  CommandQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::ConnectionRegistry> registry, util::ClockFn clock = util::Now);

  // Persists a PENDING command and delivers it right away when the device
  // is online.
  relay::v1::Command Enqueue(const std::string& device_id, const std::string& action, const google::protobuf::Struct& params);

  // Returns the number of commands delivered.
  std::size_t Drain(const std::string& device_id);

  // Throws UnknownCommand for ids the device does not hold in flight or
  // for transitions that move backwards or skip a step.
  relay::v1::Command Acknowledge(const std::string& device_id, const std::string& command_id, relay::v1::CommandStatus status,
                                 const std::string& error = {});

  std::size_t Expire(const std::string& device_id, std::chrono::milliseconds ttl);
  std::size_t ExpireAll(std::chrono::milliseconds ttl);

  // Throws NotFound.
  relay::v1::Command Get(const std::string& command_id);

  // Newest first. limit 0 returns everything after offset.
  CommandPage List(const std::string& device_id, uint32_t limit, uint32_t offset);

  // 1-based among the device's PENDING commands.
  std::optional<uint32_t> QueuePosition(const std::string& command_id);

  // Rebuilds queues from the repository. Returns the number of open commands.
  std::size_t Hydrate();

  std::size_t PendingCount() const;
  std::size_t PendingCount(const std::string& device_id);

  static relay::v1::Command ToProto(const db::model::CommandRecord& record);

 private:
  struct DeviceQueue {
    std::mutex                                               mutex;
    std::deque<db::model::CommandRecord>                     pending;
    std::unordered_map<std::string, db::model::CommandRecord> in_flight;
  };

  std::shared_ptr<DeviceQueue>              QueueFor(const std::string& device_id);
  std::vector<std::shared_ptr<DeviceQueue>> Queues() const;

  std::size_t DrainLocked(DeviceQueue& queue, const std::string& device_id);
  std::size_t ExpireLocked(DeviceQueue& queue, const std::string& device_id, std::chrono::milliseconds ttl);

  void Persist(const db::model::CommandRecord& record);

  static std::optional<uint32_t> PositionLocked(const DeviceQueue& queue, const std::string& command_id);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<registry::ConnectionRegistry> registry_;
  util::ClockFn                                 clock_;

  mutable std::mutex                                            queues_mutex_;
  std::unordered_map<std::string, std::shared_ptr<DeviceQueue>> queues_;
};

} // namespace relay::queue
