#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/transport/outbox.hpp"
#include "internal/transport/outbox_writer.hpp"

namespace {

using relay::transport::Outbox;
using relay::transport::OutboxWriter;
using relay::v1::ServerMessage;

constexpr auto kPoll = std::chrono::milliseconds(10);

ServerMessage Pong(uint64_t seq) {
  ServerMessage message;
  message.set_seq(seq);
  message.mutable_pong()->set_nonce(seq);
  return message;
}

ServerMessage ClosedNotice(uint64_t seq) {
  ServerMessage message;
  message.set_seq(seq);
  message.mutable_closed()->set_reason(relay::v1::CLOSE_REASON_PROTOCOL_ABUSE);
  return message;
}

// Peer that reads everything.
struct RecordingStream {
  std::mutex                 mutex;
  std::vector<ServerMessage> written;
  std::atomic<int>           cancels{0};

  OutboxWriter::Stream Bind() {
    return {[this](const ServerMessage& message) {
              std::lock_guard lock(mutex);
              written.push_back(message);
              return true;
            },
            [this] { return cancels.load() > 0; }, [this] { cancels.fetch_add(1); }};
  }
};

// Peer that stopped reading: every write waits until the stream is cancelled.
struct StalledStream {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    cancelled    = false;
  int                     writes_begun = 0;

  OutboxWriter::Stream Bind() {
    return {[this](const ServerMessage&) {
              std::unique_lock lock(mutex);
              ++writes_begun;
              cv.notify_all();
              cv.wait(lock, [this] { return cancelled; });
              return false;
            },
            [this] {
              std::lock_guard lock(mutex);
              return cancelled;
            },
            [this] {
              {
                std::lock_guard lock(mutex);
                cancelled = true;
              }
              cv.notify_all();
            }};
  }

  bool WaitForWrite(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return writes_begun > 0; });
  }
};

void TestWriterFlushesUpToTheCloseNotice() {
  auto            outbox = std::make_shared<Outbox>(4);
  RecordingStream stream;
  OutboxWriter    writer(outbox, stream.Bind(), kPoll);

  assert(outbox->Send(Pong(1)));
  assert(outbox->Send(Pong(2)));
  outbox->Close(ClosedNotice(3));

  assert(writer.Stop(std::chrono::seconds(5)));
  std::lock_guard lock(stream.mutex);
  assert(stream.written.size() == 3);
  assert(stream.written[0].seq() == 1);
  assert(stream.written[1].seq() == 2);
  assert(stream.written[2].has_closed());
  // Writing the notice cancels the stream so the reader unblocks.
  assert(stream.cancels.load() == 1);
}

void TestStopCancelsWriteToStalledPeer() {
  auto          outbox = std::make_shared<Outbox>(4);
  StalledStream stream;
  OutboxWriter  writer(outbox, stream.Bind(), kPoll);

  assert(outbox->Send(Pong(1)));
  assert(outbox->Send(Pong(2)));
  assert(stream.WaitForWrite(std::chrono::seconds(5)));

  // The session closes while the writer is stuck on the first message.
  outbox->Close(ClosedNotice(3));

  const auto started = std::chrono::steady_clock::now();
  assert(!writer.Stop(std::chrono::milliseconds(50)));
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

  std::lock_guard lock(stream.mutex);
  assert(stream.cancelled);
  assert(stream.writes_begun == 1);
  assert(outbox->IsClosed());
}

void TestCancelledStreamStopsIdleWriter() {
  auto            outbox = std::make_shared<Outbox>(4);
  RecordingStream stream;
  OutboxWriter    writer(outbox, stream.Bind(), kPoll);

  // Client went away without a close notice.
  stream.cancels.fetch_add(1);
  assert(writer.Stop(std::chrono::seconds(5)));
  assert(outbox->IsClosed());
  assert(!outbox->Send(Pong(1)));
}

} // namespace

int main() {
  TestWriterFlushesUpToTheCloseNotice();
  TestStopCancelsWriteToStalledPeer();
  TestCancelledStreamStopsIdleWriter();

  std::cout << "relay_unit_outbox_writer: pass\n";
  return 0;
}
