#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/transport/outbox.hpp"

namespace relay::transport {

/*
  OutboxWriter

  The one thread that drains an Outbox onto the wire. It stops after the
  close notice is written, when a write fails, or when the stream is
  cancelled.

  A peer that stops reading leaves Write blocked on flow control. Stop()
  waits `grace` for the writer and then cancels the stream, which fails
  the pending write, so the connection thread is never pinned by it.
*/
class OutboxWriter {
 public:
  struct Stream {
    std::function<bool(const relay::v1::ServerMessage&)> write; // false once the peer is gone
    std::function<bool()>                                 cancelled;
    std::function<void()>                                 cancel; // fails a pending write
  };

  OutboxWriter(std::shared_ptr<Outbox> outbox, Stream stream, std::chrono::milliseconds poll = std::chrono::milliseconds(250));
  ~OutboxWriter();

  OutboxWriter(const OutboxWriter&)            = delete;
  OutboxWriter& operator=(const OutboxWriter&) = delete;

  // Joins the writer. Returns false when it had to cancel the stream.
  bool Stop(std::chrono::milliseconds grace);

 private:
  void Run();

  std::shared_ptr<Outbox>   outbox_;
  Stream                    stream_;
  std::chrono::milliseconds poll_;

  std::mutex              mutex_;
  std::condition_variable finished_cv_;
  bool                    finished_ = false;

  std::thread thread_;
};

} // namespace relay::transport
