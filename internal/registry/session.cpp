#include "session.hpp"

#include <stdexcept>

namespace relay::registry {

Session::Session(std::string id, relay::v1::Role role, std::string identity, std::string device_id, std::shared_ptr<transport::Transport> transport,
                 util::TimePoint connected_at)
    : id_(std::move(id)),
      role_(role),
      identity_(std::move(identity)),
      device_id_(std::move(device_id)),
      connected_at_(connected_at),
      transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("session requires a transport");
  }
}

void Session::Stamp(relay::v1::ServerMessage& message) {
  message.set_seq(++last_seq_);
  if (message.device_id().empty()) {
    message.set_device_id(device_id_);
  }
}

bool Session::Send(relay::v1::ServerMessage message) {
  std::lock_guard lock(send_mutex_);
  if (transport_->IsClosed()) return false;
  Stamp(message);
  return transport_->Send(std::move(message));
}

transport::MediaOutcome Session::SendMedia(relay::v1::ServerMessage message) {
  std::lock_guard lock(send_mutex_);
  if (transport_->IsClosed()) return transport::MediaOutcome::kRejected;
  Stamp(message);
  return transport_->SendMedia(std::move(message));
}

transport::MediaOutcome Session::SendLatest(relay::v1::ServerMessage message) {
  std::lock_guard lock(send_mutex_);
  if (transport_->IsClosed()) return transport::MediaOutcome::kRejected;
  Stamp(message);
  return transport_->SendLatest(std::move(message));
}

void Session::Close(relay::v1::CloseReason reason, const std::string& detail) {
  std::lock_guard lock(send_mutex_);
  if (transport_->IsClosed()) return;

  relay::v1::ServerMessage notice;
  notice.mutable_closed()->set_reason(reason);
  notice.mutable_closed()->set_detail(detail);
  Stamp(notice);
  transport_->Close(std::move(notice));
}

bool Session::IsClosed() const {
  return transport_->IsClosed();
}

uint64_t Session::LastSequence() const {
  std::lock_guard lock(send_mutex_);
  return last_seq_;
}

} // namespace relay::registry
