#include "command_expiry_sweeper.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/queue/command_queue.hpp"

namespace relay::queue {

CommandExpirySweeper::CommandExpirySweeper(std::shared_ptr<CommandQueue> queue, std::chrono::milliseconds ttl, std::chrono::milliseconds interval)
    : queue_(std::move(queue)), ttl_(ttl), interval_(interval) {
  if (!queue_) {
    throw std::invalid_argument("sweeper requires a command queue");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("sweep interval must be positive");
  }
}

CommandExpirySweeper::~CommandExpirySweeper() {
  Stop();
}

void CommandExpirySweeper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&CommandExpirySweeper::Run, this);
}

void CommandExpirySweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t CommandExpirySweeper::SweepOnce() {
  return queue_->ExpireAll(ttl_);
}

void CommandExpirySweeper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [&] { return !running_; })) break;

    lock.unlock();
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("command expiry sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace relay::queue
