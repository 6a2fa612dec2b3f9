#include "command_queue.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace relay::queue {

using relay::v1::CommandStatus;

namespace {

bool IsTerminal(CommandStatus status) {
  return status == relay::v1::COMMAND_STATUS_COMPLETED || status == relay::v1::COMMAND_STATUS_FAILED || status == relay::v1::COMMAND_STATUS_EXPIRED;
}

// Acknowledgments may only move one step forward, or fail a command the
// device received but could not start.
bool IsAllowedAck(CommandStatus from, CommandStatus to) {
  switch (from) {
    case relay::v1::COMMAND_STATUS_DELIVERED:
      return to == relay::v1::COMMAND_STATUS_EXECUTING || to == relay::v1::COMMAND_STATUS_FAILED;
    case relay::v1::COMMAND_STATUS_EXECUTING:
      return to == relay::v1::COMMAND_STATUS_COMPLETED || to == relay::v1::COMMAND_STATUS_FAILED;
    default:
      return false;
  }
}

google::protobuf::Timestamp FromMillis(uint64_t ms) {
  return util::ToProto(util::FromUnixMillis(ms));
}

void RecordTransition(const db::model::CommandRecord& record) {
  observability::Metrics::Instance().RecordCommandTransition(relay::v1::CommandStatus_Name(record.status));
  RELAY_LOG_INFO("command transition", {observability::StringField("command_id", record.id), observability::DeviceField(record.device_id),
                                        observability::StringField("status", relay::v1::CommandStatus_Name(record.status))});
}

} // namespace

CommandQueue::CommandQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::ConnectionRegistry> registry, util::ClockFn clock)
    : repository_(std::move(repository)), registry_(std::move(registry)), clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
  if (!repository_ || !registry_) {
    throw std::invalid_argument("CommandQueue requires a repository and a registry");
  }
}

relay::v1::Command CommandQueue::ToProto(const db::model::CommandRecord& record) {
  relay::v1::Command command;
  command.set_id(record.id);
  command.set_device_id(record.device_id);
  command.set_action(record.action);
  *command.mutable_params() = util::ParseStruct(record.params_json);
  command.set_status(record.status);
  if (record.created_at_ms > 0) *command.mutable_created_at() = FromMillis(record.created_at_ms);
  if (record.delivered_at_ms > 0) *command.mutable_delivered_at() = FromMillis(record.delivered_at_ms);
  if (record.completed_at_ms > 0) *command.mutable_completed_at() = FromMillis(record.completed_at_ms);
  command.set_error(record.error);
  return command;
}

std::shared_ptr<CommandQueue::DeviceQueue> CommandQueue::QueueFor(const std::string& device_id) {
  std::lock_guard lock(queues_mutex_);
  auto&           queue = queues_[device_id];
  if (!queue) {
    queue = std::make_shared<DeviceQueue>();
  }
  return queue;
}

std::vector<std::shared_ptr<CommandQueue::DeviceQueue>> CommandQueue::Queues() const {
  std::lock_guard                           lock(queues_mutex_);
  std::vector<std::shared_ptr<DeviceQueue>> out;
  out.reserve(queues_.size());
  for (const auto& [device_id, queue] : queues_) {
    out.push_back(queue);
  }
  return out;
}

void CommandQueue::Persist(const db::model::CommandRecord& record) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpdateCommand(*tx, record), "persist command " + record.id);
  tx->Commit();
}

std::optional<uint32_t> CommandQueue::PositionLocked(const DeviceQueue& queue, const std::string& command_id) {
  for (std::size_t i = 0; i < queue.pending.size(); ++i) {
    if (queue.pending[i].id == command_id) {
      return static_cast<uint32_t>(i + 1);
    }
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Enqueue / drain
// ---------------------------------------------------------------------------

relay::v1::Command CommandQueue::Enqueue(const std::string& device_id, const std::string& action, const google::protobuf::Struct& params) {
  if (device_id.empty() || action.empty()) {
    throw util::InvalidArgument("command requires a device id and an action");
  }

  db::model::CommandRecord record;
  record.id            = util::NewId();
  record.device_id     = device_id;
  record.action        = action;
  record.params_json   = util::ToJson(params);
  record.status        = relay::v1::COMMAND_STATUS_PENDING;
  record.created_at_ms = util::ToUnixMillis(clock_());

  auto            queue = QueueFor(device_id);
  std::lock_guard lock(queue->mutex);

  {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->InsertCommand(*tx, record), "enqueue command");
    tx->Commit();
  }
  queue->pending.push_back(record);
  RecordTransition(record);

  DrainLocked(*queue, device_id);

  if (auto it = queue->in_flight.find(record.id); it != queue->in_flight.end()) {
    return ToProto(it->second);
  }
  auto command = ToProto(record);
  command.set_queue_position(PositionLocked(*queue, record.id).value_or(0));
  return command;
}

std::size_t CommandQueue::Drain(const std::string& device_id) {
  auto            queue = QueueFor(device_id);
  std::lock_guard lock(queue->mutex);
  return DrainLocked(*queue, device_id);
}

std::size_t CommandQueue::DrainLocked(DeviceQueue& queue, const std::string& device_id) {
  auto session = registry_->LookupDeviceSession(device_id);
  if (!session || queue.pending.empty()) {
    return 0;
  }

  std::size_t delivered = 0;
  while (!queue.pending.empty()) {
    const auto& next = queue.pending.front();

    relay::v1::ServerMessage message;
    auto*                    delivery = message.mutable_command();
    delivery->set_command_id(next.id);
    delivery->set_action(next.action);
    *delivery->mutable_params()     = util::ParseStruct(next.params_json);
    *delivery->mutable_created_at() = FromMillis(next.created_at_ms);

    if (!session->Send(std::move(message))) {
      RELAY_LOG_DEBUG("command delivery rejected by transport", {observability::DeviceField(device_id),
                                                                 observability::StringField("command_id", next.id)});
      break;
    }

    auto record = std::move(queue.pending.front());
    queue.pending.pop_front();
    record.status          = relay::v1::COMMAND_STATUS_DELIVERED;
    record.delivered_at_ms = util::ToUnixMillis(clock_());
    try {
      Persist(record);
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("delivered command not persisted", {observability::StringField("command_id", record.id), observability::StringField("error", e.what())});
    }
    RecordTransition(record);

    auto id = record.id;
    queue.in_flight.emplace(std::move(id), std::move(record));
    ++delivered;
  }
  return delivered;
}

// ---------------------------------------------------------------------------
// Acknowledgment
// ---------------------------------------------------------------------------

relay::v1::Command CommandQueue::Acknowledge(const std::string& device_id, const std::string& command_id, CommandStatus status, const std::string& error) {
  auto            queue = QueueFor(device_id);
  std::lock_guard lock(queue->mutex);

  auto it = queue->in_flight.find(command_id);
  if (it == queue->in_flight.end()) {
    auto tx     = repository_->Begin();
    auto stored = repository_->GetCommand(*tx, command_id);
    tx->Commit();
    if (stored && stored->device_id == device_id && stored->status == status) {
      return ToProto(*stored);
    }
    throw util::UnknownCommand("command " + command_id + " is not in flight for device " + device_id);
  }

  if (it->second.status == status) {
    return ToProto(it->second);
  }
  if (!IsAllowedAck(it->second.status, status)) {
    throw util::UnknownCommand("command " + command_id + " cannot move from " + relay::v1::CommandStatus_Name(it->second.status) + " to " +
                               relay::v1::CommandStatus_Name(status));
  }

  auto updated   = it->second;
  updated.status = status;
  if (IsTerminal(status)) {
    updated.completed_at_ms = util::ToUnixMillis(clock_());
    updated.error           = error;
  }
  Persist(updated);
  RecordTransition(updated);

  if (IsTerminal(status)) {
    queue->in_flight.erase(it);
  } else {
    it->second = updated;
  }
  return ToProto(updated);
}

// ---------------------------------------------------------------------------
// Expiry
// ---------------------------------------------------------------------------

std::size_t CommandQueue::ExpireLocked(DeviceQueue& queue, const std::string& device_id, std::chrono::milliseconds ttl) {
  const auto now_ms  = util::ToUnixMillis(clock_());
  const auto ttl_ms  = static_cast<uint64_t>(ttl.count());
  std::size_t expired = 0;

  for (auto it = queue.pending.begin(); it != queue.pending.end();) {
    if (it->created_at_ms + ttl_ms > now_ms) {
      ++it;
      continue;
    }

    auto record            = *it;
    record.status          = relay::v1::COMMAND_STATUS_EXPIRED;
    record.completed_at_ms = now_ms;
    try {
      Persist(record);
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("command expiry not persisted", {observability::StringField("command_id", record.id), observability::StringField("error", e.what())});
      ++it;
      continue;
    }
    RecordTransition(record);
    it = queue.pending.erase(it);
    ++expired;
  }

  if (expired > 0) {
    RELAY_LOG_INFO("commands expired", {observability::DeviceField(device_id), observability::IntField("count", static_cast<std::int64_t>(expired))});
  }
  return expired;
}

std::size_t CommandQueue::Expire(const std::string& device_id, std::chrono::milliseconds ttl) {
  auto            queue = QueueFor(device_id);
  std::lock_guard lock(queue->mutex);
  return ExpireLocked(*queue, device_id, ttl);
}

std::size_t CommandQueue::ExpireAll(std::chrono::milliseconds ttl) {
  std::vector<std::string> devices;
  {
    std::lock_guard lock(queues_mutex_);
    devices.reserve(queues_.size());
    for (const auto& [device_id, queue] : queues_) {
      devices.push_back(device_id);
    }
  }

  std::size_t expired = 0;
  for (const auto& device_id : devices) {
    expired += Expire(device_id, ttl);
  }
  return expired;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

relay::v1::Command CommandQueue::Get(const std::string& command_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCommand(*tx, command_id);
  tx->Commit();
  if (!record) {
    throw util::NotFound("command not found: " + command_id);
  }

  auto command = ToProto(*record);
  if (record->status == relay::v1::COMMAND_STATUS_PENDING) {
    command.set_queue_position(QueuePosition(command_id).value_or(0));
  }
  return command;
}

CommandPage CommandQueue::List(const std::string& device_id, uint32_t limit, uint32_t offset) {
  CommandPage page;
  auto        tx      = repository_->Begin();
  auto        records = repository_->ListCommandsByDevice(*tx, device_id, limit, offset);
  page.total          = repository_->CountCommandsByDevice(*tx, device_id);
  tx->Commit();

  page.commands.reserve(records.size());
  for (const auto& record : records) {
    page.commands.push_back(ToProto(record));
  }
  return page;
}

std::optional<uint32_t> CommandQueue::QueuePosition(const std::string& command_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCommand(*tx, command_id);
  tx->Commit();
  if (!record || record->status != relay::v1::COMMAND_STATUS_PENDING) {
    return std::nullopt;
  }

  auto            queue = QueueFor(record->device_id);
  std::lock_guard lock(queue->mutex);
  return PositionLocked(*queue, command_id);
}

std::size_t CommandQueue::PendingCount() const {
  std::size_t pending = 0;
  for (const auto& queue : Queues()) {
    std::lock_guard lock(queue->mutex);
    pending += queue->pending.size();
  }
  return pending;
}

std::size_t CommandQueue::PendingCount(const std::string& device_id) {
  auto            queue = QueueFor(device_id);
  std::lock_guard lock(queue->mutex);
  return queue->pending.size();
}

std::size_t CommandQueue::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListOpenCommands(*tx);
  tx->Commit();

  std::unordered_map<std::string, std::shared_ptr<DeviceQueue>> rebuilt;
  for (auto& record : records) {
    auto& queue = rebuilt[record.device_id];
    if (!queue) {
      queue = std::make_shared<DeviceQueue>();
    }
    if (record.status == relay::v1::COMMAND_STATUS_PENDING) {
      queue->pending.push_back(std::move(record));
    } else {
      auto id = record.id;
      queue->in_flight.emplace(std::move(id), std::move(record));
    }
  }

  {
    std::lock_guard lock(queues_mutex_);
    queues_ = std::move(rebuilt);
  }

  RELAY_LOG_INFO("command queues hydrated", {observability::IntField("open_commands", static_cast<std::int64_t>(records.size()))});
  return records.size();
}

} // namespace relay::queue
