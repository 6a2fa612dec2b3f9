#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/media/media_router.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/transport/outbox.hpp"
#include "recording_transport.hpp"

namespace {

using relay::media::MediaRouter;
using relay::registry::ConnectionRegistry;
using relay::testing::RecordingTransport;
using relay::transport::Outbox;
using relay::v1::ServerMessage;

relay::v1::MediaFrame Frame(uint64_t sequence) {
  relay::v1::MediaFrame frame;
  frame.set_sequence(sequence);
  frame.set_payload("jpeg-bytes-" + std::to_string(sequence));
  frame.set_mime_type("image/jpeg");
  return frame;
}

void TestStalledControllerOnlyLosesItsOwnFrames() {
  constexpr uint64_t    kFrames   = 100;
  constexpr std::size_t kCapacity = 8;

  auto registry = std::make_shared<ConnectionRegistry>();
  MediaRouter router(registry);

  auto device  = registry->AdmitDevice("dev-1", std::make_shared<RecordingTransport>());
  auto stalled = std::make_shared<Outbox>(kCapacity);
  auto healthy = std::make_shared<RecordingTransport>();
  (void)registry->AdmitController("ctl-stalled", "dev-1", stalled);
  (void)registry->AdmitController("ctl-healthy", "dev-1", healthy);

  for (uint64_t i = 1; i <= kFrames; ++i) {
    assert(router.Publish(*device, Frame(i)) == 2);
  }

  const auto received = healthy->Of(ServerMessage::kFrame);
  assert(received.size() == kFrames);
  for (uint64_t i = 0; i < kFrames; ++i) {
    assert(received[i].frame().sequence() == i + 1);
    assert(received[i].device_id() == "dev-1");
  }

  assert(stalled->MediaDepth() == kCapacity);
  assert(stalled->DroppedMedia() == kFrames - kCapacity);

  // Sequence numbers 1..92 were stamped and dropped: the stalled
  // controller observes a gap before its first frame.
  uint64_t previous_seq = kFrames - kCapacity;
  for (uint64_t expected = kFrames - kCapacity + 1; expected <= kFrames; ++expected) {
    auto message = stalled->Pop(std::chrono::milliseconds(0));
    assert(message.has_value());
    assert(message->frame().sequence() == expected);
    assert(message->seq() == previous_seq + 1);
    previous_seq = message->seq();
  }
  assert(!stalled->Pop(std::chrono::milliseconds(0)).has_value());

  const auto stats = router.Stats();
  assert(stats.published == kFrames);
  assert(stats.relayed == 2 * kFrames);
  assert(stats.dropped == kFrames - kCapacity);
  assert(stats.rejected == 0);
}

void TestStaleAndControllerSessionsAreRejected() {
  auto registry = std::make_shared<ConnectionRegistry>();
  MediaRouter router(registry);

  auto watcher    = std::make_shared<RecordingTransport>();
  auto controller = registry->AdmitController("ctl-1", "dev-2", watcher);
  auto old_device = registry->AdmitDevice("dev-2", std::make_shared<RecordingTransport>());
  auto new_device = registry->AdmitDevice("dev-2", std::make_shared<RecordingTransport>());

  assert(router.Publish(*old_device, Frame(1)) == 0);
  assert(router.Publish(*controller, Frame(2)) == 0);
  assert(router.Publish(*new_device, Frame(3)) == 1);

  const auto received = watcher->Of(ServerMessage::kFrame);
  assert(received.size() == 1);
  assert(received[0].frame().sequence() == 3);
  assert(router.Stats().rejected == 2);
  assert(router.Stats().published == 1);
}

void TestAudioAndLocationFanOut() {
  auto registry = std::make_shared<ConnectionRegistry>();
  MediaRouter router(registry);

  auto device  = registry->AdmitDevice("dev-3", std::make_shared<RecordingTransport>());
  auto stalled = std::make_shared<Outbox>(1);
  (void)registry->AdmitController("ctl-1", "dev-3", stalled);

  relay::v1::AudioChunk chunk;
  chunk.set_sequence(1);
  chunk.set_payload("pcm");
  chunk.set_codec("opus");
  assert(router.Publish(*device, chunk) == 1);

  // A stalled controller keeps only the newest location fix.
  constexpr int kFixes = 1000;
  for (int i = 0; i < kFixes; ++i) {
    relay::v1::LocationUpdate location;
    location.set_latitude(52.0 + i * 0.001);
    location.set_longitude(13.0);
    assert(router.PublishLocation(*device, location) == 1);
  }
  assert(stalled->MediaDepth() == 1);
  assert(stalled->Depth() == 2);
  assert(router.Stats().dropped == kFixes - 1);

  std::vector<ServerMessage> drained;
  while (auto message = stalled->Pop(std::chrono::milliseconds(0))) {
    drained.push_back(*message);
  }
  assert(drained.size() == 2);
  assert(drained[0].has_audio());
  assert(drained[1].has_location());
  assert(drained[1].location().latitude() == 52.0 + (kFixes - 1) * 0.001);
  assert(drained[1].seq() > drained[0].seq());
}

void TestClosedControllerCountsAsDrop() {
  auto registry = std::make_shared<ConnectionRegistry>();
  MediaRouter router(registry);

  auto device     = registry->AdmitDevice("dev-4", std::make_shared<RecordingTransport>());
  auto controller = registry->AdmitController("ctl-1", "dev-4", std::make_shared<RecordingTransport>());
  controller->Close(relay::v1::CLOSE_REASON_NORMAL);

  assert(router.Publish(*device, Frame(1)) == 0);
  assert(router.Stats().dropped == 1);
  assert(router.Stats().published == 1);
}

} // namespace

int main() {
  TestStalledControllerOnlyLosesItsOwnFrames();
  TestStaleAndControllerSessionsAreRejected();
  TestAudioAndLocationFanOut();
  TestClosedControllerCountsAsDrop();

  std::cout << "relay_unit_media_router: pass\n";
  return 0;
}
