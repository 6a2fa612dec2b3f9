#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/transport/transport.hpp"

namespace relay::transport {

/*
  Outbox

  Per-session buffer between producers (registry, queue, media router) and
  the single writer that owns the wire.

    control lane   unbounded FIFO
    media lane     at most `media_capacity` frames, drop-oldest
    latest slot    one message, replaced by a newer one (location)

  Pop merges the lanes by sequence number so the writer emits frames in
  the order they were stamped.
*/
class Outbox final : public Transport {
 public:
  explicit Outbox(std::size_t media_capacity);

  bool Send(relay::v1::ServerMessage message) override;
  MediaOutcome SendMedia(relay::v1::ServerMessage message) override;
  MediaOutcome SendLatest(relay::v1::ServerMessage message) override;
  void Close(relay::v1::ServerMessage notice) override;
  bool IsClosed() const override;

  // Waits up to `timeout` for a message. Returns nullopt on timeout and,
  // once closed, after the close notice has been handed out.
  std::optional<relay::v1::ServerMessage> Pop(std::chrono::milliseconds timeout);

  // Closed with nothing left to hand out.
  bool Drained() const;

  std::uint64_t DroppedMedia() const;
  std::size_t   MediaDepth() const;
  // Messages buffered across all lanes, the close notice excluded.
  std::size_t Depth() const;

 private:
  std::optional<relay::v1::ServerMessage> TakeLocked();

  const std::size_t media_capacity_;

  mutable std::mutex                      mutex_;
  std::condition_variable                 cv_;
  std::deque<relay::v1::ServerMessage>    control_;
  std::deque<relay::v1::ServerMessage>    media_;
  std::optional<relay::v1::ServerMessage> latest_;
  std::optional<relay::v1::ServerMessage> notice_;
  bool                                    closed_        = false;
  std::uint64_t                           dropped_media_ = 0;
};

} // namespace relay::transport
