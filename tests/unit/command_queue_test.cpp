#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/presence/presence_tracker.hpp"
#include "internal/queue/command_expiry_sweeper.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "recording_transport.hpp"

namespace {

using relay::db::memory::MemoryRepository;
using relay::presence::PresenceTracker;
using relay::queue::CommandQueue;
using relay::registry::ConnectionRegistry;
using relay::testing::RecordingTransport;
using relay::util::TimePoint;
using relay::v1::CommandStatus;
using relay::v1::ServerMessage;

struct Fixture {
  TimePoint                           now        = relay::util::FromUnixMillis(1'700'000'000'000ULL);
  std::shared_ptr<MemoryRepository>   repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<CommandQueue>       queue;
  std::shared_ptr<PresenceTracker>    presence;

  Fixture() {
    auto clock = [this] { return now; };
    registry   = std::make_shared<ConnectionRegistry>(clock);
    queue      = std::make_shared<CommandQueue>(repository, registry, clock);
    presence   = std::make_shared<PresenceTracker>(repository, registry, queue, clock);
    registry->AddObserver(presence);
    AddDevice("dev-1");
    AddDevice("dev-2");
  }

  void AddDevice(const std::string& id) {
    relay::db::model::DeviceRecord device;
    device.id   = id;
    device.name = id;
    auto tx     = repository->Begin();
    assert(repository->InsertDevice(*tx, device));
    tx->Commit();
  }
};

google::protobuf::Struct Params(const std::string& key, const std::string& value) {
  google::protobuf::Struct params;
  (*params.mutable_fields())[key].set_string_value(value);
  return params;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestOfflineCommandsDrainInOrderOnReconnect() {
  Fixture f;

  const auto c1 = f.queue->Enqueue("dev-1", "start_camera", Params("lens", "back"));
  const auto c2 = f.queue->Enqueue("dev-1", "set_quality", Params("level", "high"));
  const auto c3 = f.queue->Enqueue("dev-1", "stop_camera", {});

  assert(c1.status() == relay::v1::COMMAND_STATUS_PENDING);
  assert(c1.queue_position() == 1);
  assert(c2.queue_position() == 2);
  assert(c3.queue_position() == 3);
  assert(f.queue->PendingCount("dev-1") == 3);
  assert(f.queue->Get(c2.id()).queue_position() == 2);

  auto transport = std::make_shared<RecordingTransport>();
  (void)f.registry->AdmitDevice("dev-1", transport);

  const auto deliveries = transport->Of(ServerMessage::kCommand);
  assert(deliveries.size() == 3);
  assert(deliveries[0].command().command_id() == c1.id());
  assert(deliveries[1].command().command_id() == c2.id());
  assert(deliveries[2].command().command_id() == c3.id());
  assert(deliveries[0].command().action() == "start_camera");
  assert(deliveries[0].command().params().fields().at("lens").string_value() == "back");
  assert(deliveries[0].seq() < deliveries[1].seq() && deliveries[1].seq() < deliveries[2].seq());

  assert(f.queue->PendingCount("dev-1") == 0);
  const auto delivered = f.queue->Get(c1.id());
  assert(delivered.status() == relay::v1::COMMAND_STATUS_DELIVERED);
  assert(delivered.has_delivered_at());
  assert(delivered.queue_position() == 0);
}

void TestStatusSequenceMovesForwardOnly() {
  Fixture f;
  auto    transport = std::make_shared<RecordingTransport>();
  (void)f.registry->AdmitDevice("dev-1", transport);

  std::vector<CommandStatus> seen;
  const auto                 command = f.queue->Enqueue("dev-1", "take_photo", {});
  seen.push_back(command.status());
  assert(command.status() == relay::v1::COMMAND_STATUS_DELIVERED);

  seen.push_back(f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_EXECUTING).status());

  // Duplicate acknowledgments are accepted without a transition.
  assert(f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_EXECUTING).status() == relay::v1::COMMAND_STATUS_EXECUTING);

  assert(Throws<relay::util::UnknownCommand>([&] {
    (void)f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_DELIVERED);
  }));
  assert(Throws<relay::util::UnknownCommand>([&] {
    (void)f.queue->Acknowledge("dev-2", command.id(), relay::v1::COMMAND_STATUS_COMPLETED);
  }));

  seen.push_back(f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_COMPLETED).status());
  assert(f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_COMPLETED).status() == relay::v1::COMMAND_STATUS_COMPLETED);
  assert(Throws<relay::util::UnknownCommand>([&] {
    (void)f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_FAILED);
  }));
  assert(Throws<relay::util::UnknownCommand>([&] {
    (void)f.queue->Acknowledge("dev-1", "no-such-command", relay::v1::COMMAND_STATUS_EXECUTING);
  }));

  const std::vector<CommandStatus> expected{relay::v1::COMMAND_STATUS_DELIVERED, relay::v1::COMMAND_STATUS_EXECUTING,
                                            relay::v1::COMMAND_STATUS_COMPLETED};
  assert(seen == expected);

  const auto stored = f.queue->Get(command.id());
  assert(stored.status() == relay::v1::COMMAND_STATUS_COMPLETED);
  assert(stored.has_completed_at());
}

void TestDeliveredCommandMayFailDirectly() {
  Fixture f;
  (void)f.registry->AdmitDevice("dev-1", std::make_shared<RecordingTransport>());

  const auto command = f.queue->Enqueue("dev-1", "start_audio", {});
  const auto failed  = f.queue->Acknowledge("dev-1", command.id(), relay::v1::COMMAND_STATUS_FAILED, "microphone busy");
  assert(failed.status() == relay::v1::COMMAND_STATUS_FAILED);
  assert(failed.error() == "microphone busy");
  assert(f.queue->Get(command.id()).error() == "microphone busy");
}

void TestPendingCommandsExpire() {
  Fixture f;
  const auto old_command = f.queue->Enqueue("dev-1", "start_camera", {});
  f.now += std::chrono::hours(23);
  const auto fresh_command = f.queue->Enqueue("dev-1", "stop_camera", {});
  f.now += std::chrono::hours(2);

  relay::queue::CommandExpirySweeper sweeper(f.queue, std::chrono::hours(24), std::chrono::seconds(30));
  assert(sweeper.SweepOnce() == 1);
  assert(sweeper.SweepOnce() == 0);

  const auto expired = f.queue->Get(old_command.id());
  assert(expired.status() == relay::v1::COMMAND_STATUS_EXPIRED);
  assert(expired.has_completed_at());
  assert(f.queue->Get(fresh_command.id()).queue_position() == 1);

  auto transport = std::make_shared<RecordingTransport>();
  (void)f.registry->AdmitDevice("dev-1", transport);
  const auto deliveries = transport->Of(ServerMessage::kCommand);
  assert(deliveries.size() == 1);
  assert(deliveries[0].command().command_id() == fresh_command.id());

  assert(Throws<relay::util::UnknownCommand>([&] {
    (void)f.queue->Acknowledge("dev-1", old_command.id(), relay::v1::COMMAND_STATUS_EXECUTING);
  }));
}

void TestClosedTransportKeepsCommandPending() {
  Fixture f;
  auto    session = f.registry->AdmitDevice("dev-1", std::make_shared<RecordingTransport>());
  session->Close(relay::v1::CLOSE_REASON_NORMAL);

  const auto command = f.queue->Enqueue("dev-1", "start_camera", {});
  assert(command.status() == relay::v1::COMMAND_STATUS_PENDING);
  assert(command.queue_position() == 1);

  (void)f.registry->Remove(session);
  auto transport = std::make_shared<RecordingTransport>();
  (void)f.registry->AdmitDevice("dev-1", transport);
  assert(transport->Count(ServerMessage::kCommand) == 1);
}

void TestHydrateRestoresQueues() {
  Fixture f;
  auto    session   = f.registry->AdmitDevice("dev-1", std::make_shared<RecordingTransport>());
  const auto running = f.queue->Enqueue("dev-1", "start_camera", {});
  (void)f.queue->Acknowledge("dev-1", running.id(), relay::v1::COMMAND_STATUS_EXECUTING);
  (void)f.registry->Remove(session);

  const auto a = f.queue->Enqueue("dev-1", "set_quality", {});
  const auto b = f.queue->Enqueue("dev-1", "stop_camera", {});
  (void)f.queue->Enqueue("dev-2", "ping_me", {});

  // A fresh process sees the same repository.
  auto restarted_registry = std::make_shared<ConnectionRegistry>();
  auto restarted          = std::make_shared<CommandQueue>(f.repository, restarted_registry);
  assert(restarted->Hydrate() == 4);
  assert(restarted->PendingCount() == 3);
  assert(restarted->PendingCount("dev-1") == 2);
  assert(restarted->QueuePosition(a.id()) == 1u);
  assert(restarted->QueuePosition(b.id()) == 2u);
  assert(!restarted->QueuePosition(running.id()).has_value());

  const auto completed = restarted->Acknowledge("dev-1", running.id(), relay::v1::COMMAND_STATUS_COMPLETED);
  assert(completed.status() == relay::v1::COMMAND_STATUS_COMPLETED);
}

void TestListIsNewestFirst() {
  Fixture f;
  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(f.queue->Enqueue("dev-1", "action-" + std::to_string(i), {}).id());
  }

  const auto page = f.queue->List("dev-1", 2, 1);
  assert(page.total == 5);
  assert(page.commands.size() == 2);
  assert(page.commands[0].id() == ids[3]);
  assert(page.commands[1].id() == ids[2]);

  assert(f.queue->List("dev-1", 0, 0).commands.size() == 5);
  assert(f.queue->List("dev-2", 10, 0).total == 0);
}

void TestInvalidEnqueueIsRejected() {
  Fixture f;
  assert(Throws<relay::util::InvalidArgument>([&] { (void)f.queue->Enqueue("dev-1", "", {}); }));
  assert(Throws<relay::util::InvalidArgument>([&] { (void)f.queue->Enqueue("", "start_camera", {}); }));
  assert(Throws<relay::util::NotFound>([&] { (void)f.queue->Get("missing"); }));
}

} // namespace

int main() {
  TestOfflineCommandsDrainInOrderOnReconnect();
  TestStatusSequenceMovesForwardOnly();
  TestDeliveredCommandMayFailDirectly();
  TestPendingCommandsExpire();
  TestClosedTransportKeepsCommandPending();
  TestHydrateRestoresQueues();
  TestListIsNewestFirst();
  TestInvalidEnqueueIsRejected();

  std::cout << "relay_unit_command_queue: pass\n";
  return 0;
}
