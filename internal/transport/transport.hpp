#pragma once

#include "relay/v1/envelope.pb.h"

namespace relay::transport {

enum class MediaOutcome {
  kQueued,
  kDisplacedOldest, // queued; an older buffered message was dropped
  kRejected,        // transport closed
};

/*
  Outbound half of a live connection.

  Send and SendMedia never block. Both refuse writes once the transport is
  closed; a false return from Send is a rejected write.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  // Control lane: ordered, unbounded.
  virtual bool Send(relay::v1::ServerMessage message) = 0;

  // Media lane: bounded, drops the oldest buffered frame when full.
  virtual MediaOutcome SendMedia(relay::v1::ServerMessage message) = 0;

  // Latest-value slot: holds one message, ordered with the control lane.
  // A newer message replaces one that has not been written yet.
  virtual MediaOutcome SendLatest(relay::v1::ServerMessage message) = 0;

  // Queues `notice` (a closed message) as the final message and refuses
  // every later write. Idempotent.
  virtual void Close(relay::v1::ServerMessage notice) = 0;

  virtual bool IsClosed() const = 0;
};

} // namespace relay::transport
