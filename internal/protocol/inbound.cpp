#include "inbound.hpp"

#include "internal/util/errors.hpp"

namespace relay::protocol {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void Require(bool condition, const char* what) {
  if (!condition) {
    throw util::MalformedMessage(what);
  }
}

} // namespace

Inbound Decode(relay::v1::ClientMessage message) {
  using relay::v1::ClientMessage;

  switch (message.payload_case()) {
    case ClientMessage::kRegister:
      return std::move(*message.mutable_register_());
    case ClientMessage::kStatus:
      Require(message.status().has_report(), "status update without report");
      return std::move(*message.mutable_status());
    case ClientMessage::kCommand:
      Require(!message.command().action().empty(), "command without action");
      return std::move(*message.mutable_command());
    case ClientMessage::kCommandAck:
      Require(!message.command_ack().command_id().empty(), "command_ack without command_id");
      Require(message.command_ack().status() != relay::v1::COMMAND_STATUS_UNSPECIFIED, "command_ack without status");
      return std::move(*message.mutable_command_ack());
    case ClientMessage::kFrame:
      Require(!message.frame().payload().empty(), "frame without payload");
      return std::move(*message.mutable_frame());
    case ClientMessage::kAudio:
      Require(!message.audio().payload().empty(), "audio without payload");
      return std::move(*message.mutable_audio());
    case ClientMessage::kLocation:
      return std::move(*message.mutable_location());
    case ClientMessage::kPing:
      return std::move(*message.mutable_ping());
    case ClientMessage::PAYLOAD_NOT_SET:
      break;
  }
  throw util::MalformedMessage("client message has no payload");
}

std::string_view KindName(const Inbound& message) {
  return std::visit(Overloaded{
                        [](const relay::v1::RegisterRequest&) -> std::string_view { return "register"; },
                        [](const relay::v1::StatusUpdate&) -> std::string_view { return "status"; },
                        [](const relay::v1::SubmitCommand&) -> std::string_view { return "command"; },
                        [](const relay::v1::CommandAck&) -> std::string_view { return "command_ack"; },
                        [](const relay::v1::MediaFrame&) -> std::string_view { return "frame"; },
                        [](const relay::v1::AudioChunk&) -> std::string_view { return "audio"; },
                        [](const relay::v1::LocationUpdate&) -> std::string_view { return "location"; },
                        [](const relay::v1::Ping&) -> std::string_view { return "ping"; },
                    },
                    message);
}

} // namespace relay::protocol
