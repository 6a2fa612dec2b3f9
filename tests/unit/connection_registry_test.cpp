#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/registry/connection_registry.hpp"
#include "recording_transport.hpp"

namespace {

using relay::registry::ConnectionRegistry;
using relay::registry::RegistryObserver;
using relay::registry::Session;
using relay::testing::RecordingTransport;
using relay::v1::ServerMessage;

class CountingObserver final : public RegistryObserver {
 public:
  void OnDeviceAdmitted(const std::shared_ptr<Session>&, bool superseded) override {
    admitted.fetch_add(1);
    if (superseded) supersessions.fetch_add(1);
  }
  void OnDeviceRemoved(const std::shared_ptr<Session>&) override {
    removed.fetch_add(1);
  }
  void OnControllerAdmitted(const std::shared_ptr<Session>&) override {
    controllers_admitted.fetch_add(1);
  }
  void OnControllerRemoved(const std::shared_ptr<Session>&) override {
    controllers_removed.fetch_add(1);
  }

  std::atomic<int> admitted{0};
  std::atomic<int> supersessions{0};
  std::atomic<int> removed{0};
  std::atomic<int> controllers_admitted{0};
  std::atomic<int> controllers_removed{0};
};

void TestConcurrentAdmissionLeavesOneSurvivor() {
  constexpr int kAttempts = 32;

  auto registry = std::make_shared<ConnectionRegistry>();
  auto observer = std::make_shared<CountingObserver>();
  registry->AddObserver(observer);

  std::vector<std::shared_ptr<RecordingTransport>> transports;
  for (int i = 0; i < kAttempts; ++i) {
    transports.push_back(std::make_shared<RecordingTransport>());
  }

  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kAttempts; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      (void)registry->AdmitDevice("dev-1", transports[i]);
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  int open       = 0;
  int superseded = 0;
  for (const auto& transport : transports) {
    if (!transport->IsClosed()) {
      ++open;
    } else {
      assert(transport->CloseReason() == relay::v1::CLOSE_REASON_SUPERSEDED);
      ++superseded;
    }
  }
  assert(open == 1);
  assert(superseded == kAttempts - 1);
  assert(observer->admitted.load() == kAttempts);
  assert(observer->supersessions.load() == kAttempts - 1);

  auto current = registry->LookupDeviceSession("dev-1");
  assert(current != nullptr);
  assert(!current->IsClosed());
  assert(registry->Stats().device_sessions == 1);
}

void TestSupersededSessionRemovalIsANoop() {
  auto registry = std::make_shared<ConnectionRegistry>();
  auto observer = std::make_shared<CountingObserver>();
  registry->AddObserver(observer);

  auto first  = registry->AdmitDevice("dev-2", std::make_shared<RecordingTransport>());
  auto second = registry->AdmitDevice("dev-2", std::make_shared<RecordingTransport>());
  assert(first->IsClosed());
  assert(!registry->IsCurrentDeviceSession(*first));
  assert(registry->IsCurrentDeviceSession(*second));

  assert(!registry->Remove(first).has_value());
  assert(observer->removed.load() == 0);
  assert(registry->LookupDeviceSession("dev-2") == second);

  auto removed = registry->Remove(second);
  assert(removed.has_value());
  assert(removed->device_id == "dev-2");
  assert(removed->role == relay::v1::ROLE_DEVICE);
  assert(observer->removed.load() == 1);
  assert(registry->LookupDeviceSession("dev-2") == nullptr);

  assert(!registry->Remove(second).has_value());
  assert(observer->removed.load() == 1);
}

void TestGreetingPrecedesObserverEvents() {
  class OrderObserver final : public RegistryObserver {
   public:
    void OnDeviceAdmitted(const std::shared_ptr<Session>& session, bool) override {
      ServerMessage message;
      message.mutable_pong()->set_nonce(2);
      (void)session->Send(message);
    }
    void OnDeviceRemoved(const std::shared_ptr<Session>&) override {
    }
  };

  auto registry = std::make_shared<ConnectionRegistry>();
  auto observer = std::make_shared<OrderObserver>();
  registry->AddObserver(observer);

  auto transport = std::make_shared<RecordingTransport>();
  (void)registry->AdmitDevice("dev-3", transport, [](Session& session) {
    ServerMessage message;
    message.mutable_pong()->set_nonce(1);
    (void)session.Send(message);
  });

  const auto messages = transport->Messages();
  assert(messages.size() == 2);
  assert(messages[0].pong().nonce() == 1 && messages[0].seq() == 1);
  assert(messages[1].pong().nonce() == 2 && messages[1].seq() == 2);
  assert(messages[0].device_id() == "dev-3");
}

void TestGreetingRunsBeforeSessionIsVisible() {
  auto registry = std::make_shared<ConnectionRegistry>();
  auto previous = registry->AdmitDevice("dev-8", std::make_shared<RecordingTransport>());

  bool device_greeted = false;
  auto device         = registry->AdmitDevice("dev-8", std::make_shared<RecordingTransport>(), [&](Session&) {
    // A concurrent lookup still sees the old session, so nothing can be
    // queued on the new one ahead of its greeting.
    assert(registry->LookupDeviceSession("dev-8") == previous);
    device_greeted = true;
  });
  assert(device_greeted);
  assert(registry->LookupDeviceSession("dev-8") == device);

  bool controller_greeted = false;
  auto controller         = registry->AdmitController("ctl-8", "dev-8", std::make_shared<RecordingTransport>(), [&](Session&) {
    assert(registry->LookupControllerSessions("dev-8").empty());
    controller_greeted = true;
  });
  assert(controller_greeted);
  assert(registry->LookupControllerSessions("dev-8").size() == 1);
  assert(registry->LookupControllerSessions("dev-8")[0] == controller);
}

void TestControllersAndBulkClose() {
  auto registry = std::make_shared<ConnectionRegistry>();
  auto observer = std::make_shared<CountingObserver>();
  registry->AddObserver(observer);

  auto device_transport = std::make_shared<RecordingTransport>();
  auto tablet_transport = std::make_shared<RecordingTransport>();
  auto phone_transport  = std::make_shared<RecordingTransport>();
  auto other_transport  = std::make_shared<RecordingTransport>();

  (void)registry->AdmitDevice("dev-4", device_transport);
  auto tablet = registry->AdmitController("ctl-a", "dev-4", tablet_transport);
  (void)registry->AdmitController("ctl-b", "dev-4", phone_transport);
  (void)registry->AdmitController("ctl-c", "dev-5", other_transport);

  assert(observer->controllers_admitted.load() == 3);
  assert(registry->LookupControllerSessions("dev-4").size() == 2);
  assert(registry->LookupControllerSessions("dev-5").size() == 1);
  assert(registry->LookupControllerSessions("dev-6").empty());
  assert(tablet->Identity() == "ctl-a");
  assert(tablet->DeviceId() == "dev-4");

  auto stats = registry->Stats();
  assert(stats.device_sessions == 1);
  assert(stats.controller_sessions == 3);
  assert(stats.online_devices.size() == 1 && stats.online_devices[0] == "dev-4");

  assert(registry->Remove(tablet).has_value());
  assert(observer->controllers_removed.load() == 1);
  assert(registry->LookupControllerSessions("dev-4").size() == 1);

  registry->CloseDevice("dev-4", relay::v1::CLOSE_REASON_UNPAIRED);
  assert(device_transport->CloseReason() == relay::v1::CLOSE_REASON_UNPAIRED);
  assert(phone_transport->CloseReason() == relay::v1::CLOSE_REASON_UNPAIRED);
  assert(!other_transport->IsClosed());
  // Removed sessions are left alone.
  assert(!tablet_transport->IsClosed());

  registry->CloseAll(relay::v1::CLOSE_REASON_SHUTDOWN);
  assert(other_transport->CloseReason() == relay::v1::CLOSE_REASON_SHUTDOWN);
  assert(device_transport->CloseReason() == relay::v1::CLOSE_REASON_UNPAIRED);
}

void TestExpiredObserversAreSkipped() {
  auto registry = std::make_shared<ConnectionRegistry>();
  {
    auto observer = std::make_shared<CountingObserver>();
    registry->AddObserver(observer);
  }
  auto session = registry->AdmitDevice("dev-7", std::make_shared<RecordingTransport>());
  assert(registry->Remove(session).has_value());
}

} // namespace

int main() {
  TestConcurrentAdmissionLeavesOneSurvivor();
  TestSupersededSessionRemovalIsANoop();
  TestGreetingPrecedesObserverEvents();
  TestGreetingRunsBeforeSessionIsVisible();
  TestControllersAndBulkClose();
  TestExpiredObserversAreSkipped();

  std::cout << "relay_unit_connection_registry: pass\n";
  return 0;
}
