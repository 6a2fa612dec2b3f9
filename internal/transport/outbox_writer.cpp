#include "outbox_writer.hpp"

#include <stdexcept>

namespace relay::transport {

OutboxWriter::OutboxWriter(std::shared_ptr<Outbox> outbox, Stream stream, std::chrono::milliseconds poll)
    : outbox_(std::move(outbox)), stream_(std::move(stream)), poll_(poll) {
  if (!outbox_ || !stream_.write || !stream_.cancelled || !stream_.cancel) {
    throw std::invalid_argument("OutboxWriter requires an outbox and a complete stream");
  }
  thread_ = std::thread(&OutboxWriter::Run, this);
}

OutboxWriter::~OutboxWriter() {
  if (thread_.joinable()) {
    Stop(std::chrono::milliseconds(0));
  }
}

void OutboxWriter::Run() {
  for (;;) {
    auto message = outbox_->Pop(poll_);
    if (!message) {
      if (outbox_->Drained()) break;
      if (stream_.cancelled()) {
        outbox_->Close(relay::v1::ServerMessage{});
        break;
      }
      continue;
    }

    const bool last = message->has_closed();
    if (!stream_.write(*message)) {
      // Peer is gone: refuse further writes so producers see a dead session.
      outbox_->Close(relay::v1::ServerMessage{});
      stream_.cancel();
      break;
    }
    if (last) {
      // Unblocks the reader when the close came from elsewhere
      // (supersession, unpairing, shutdown).
      stream_.cancel();
      break;
    }
  }

  {
    std::lock_guard lock(mutex_);
    finished_ = true;
  }
  finished_cv_.notify_all();
}

bool OutboxWriter::Stop(std::chrono::milliseconds grace) {
  bool on_its_own = true;
  {
    std::unique_lock lock(mutex_);
    on_its_own = finished_cv_.wait_for(lock, grace, [this] { return finished_; });
  }
  if (!on_its_own) {
    stream_.cancel();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  return on_its_own;
}

} // namespace relay::transport
