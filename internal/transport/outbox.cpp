#include "outbox.hpp"

#include <stdexcept>

namespace relay::transport {

Outbox::Outbox(std::size_t media_capacity) : media_capacity_(media_capacity) {
  if (media_capacity_ == 0) {
    throw std::invalid_argument("outbox media capacity must be positive");
  }
}

bool Outbox::Send(relay::v1::ServerMessage message) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    control_.push_back(std::move(message));
  }
  cv_.notify_one();
  return true;
}

MediaOutcome Outbox::SendMedia(relay::v1::ServerMessage message) {
  auto outcome = MediaOutcome::kQueued;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return MediaOutcome::kRejected;
    if (media_.size() >= media_capacity_) {
      media_.pop_front();
      ++dropped_media_;
      outcome = MediaOutcome::kDisplacedOldest;
    }
    media_.push_back(std::move(message));
  }
  cv_.notify_one();
  return outcome;
}

MediaOutcome Outbox::SendLatest(relay::v1::ServerMessage message) {
  auto outcome = MediaOutcome::kQueued;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return MediaOutcome::kRejected;
    if (latest_) {
      ++dropped_media_;
      outcome = MediaOutcome::kDisplacedOldest;
    }
    latest_ = std::move(message);
  }
  cv_.notify_one();
  return outcome;
}

void Outbox::Close(relay::v1::ServerMessage notice) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
    // Frames still buffered are stale once the peer is told to go away.
    dropped_media_ += media_.size() + (latest_ ? 1 : 0);
    media_.clear();
    latest_.reset();
    notice_ = std::move(notice);
  }
  cv_.notify_all();
}

bool Outbox::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

bool Outbox::Drained() const {
  std::lock_guard lock(mutex_);
  return closed_ && control_.empty() && media_.empty() && !latest_ && !notice_;
}

std::uint64_t Outbox::DroppedMedia() const {
  std::lock_guard lock(mutex_);
  return dropped_media_;
}

std::size_t Outbox::MediaDepth() const {
  std::lock_guard lock(mutex_);
  return media_.size();
}

std::size_t Outbox::Depth() const {
  std::lock_guard lock(mutex_);
  return control_.size() + media_.size() + (latest_ ? 1 : 0);
}

std::optional<relay::v1::ServerMessage> Outbox::TakeLocked() {
  std::deque<relay::v1::ServerMessage>* lane = nullptr;
  if (!control_.empty() && !media_.empty()) {
    lane = control_.front().seq() <= media_.front().seq() ? &control_ : &media_;
  } else if (!control_.empty()) {
    lane = &control_;
  } else if (!media_.empty()) {
    lane = &media_;
  }

  if (latest_ && (!lane || latest_->seq() < lane->front().seq())) {
    auto message = std::move(*latest_);
    latest_.reset();
    return message;
  }

  if (lane) {
    auto message = std::move(lane->front());
    lane->pop_front();
    return message;
  }

  if (notice_) {
    auto notice = std::move(*notice_);
    notice_.reset();
    return notice;
  }
  return std::nullopt;
}

std::optional<relay::v1::ServerMessage> Outbox::Pop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return !control_.empty() || !media_.empty() || latest_.has_value() || notice_.has_value(); });
  return TakeLocked();
}

} // namespace relay::transport
