#pragma once

#include <string_view>
#include <variant>

#include "relay/v1/envelope.pb.h"

namespace relay::protocol {

/*
  Closed set of messages a client may send, decoded from the ClientMessage
  oneof. Dispatch with std::visit; adding an alternative breaks every
  visitor that does not handle it.
*/
using Inbound = std::variant<relay::v1::RegisterRequest, relay::v1::StatusUpdate, relay::v1::SubmitCommand, relay::v1::CommandAck,
                             relay::v1::MediaFrame, relay::v1::AudioChunk, relay::v1::LocationUpdate, relay::v1::Ping>;

// Throws util::MalformedMessage when no payload is set or a required field
// is missing.
Inbound Decode(relay::v1::ClientMessage message);

std::string_view KindName(const Inbound& message);

} // namespace relay::protocol
