#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace relay::queue {

class CommandQueue;

/*
  Background worker that expires stale PENDING commands.

  Calls CommandQueue::ExpireAll(ttl) every `interval` until stopped.
*/
class CommandExpirySweeper {
 public:
  CommandExpirySweeper(std::shared_ptr<CommandQueue> queue, std::chrono::milliseconds ttl, std::chrono::milliseconds interval);
  ~CommandExpirySweeper();

  CommandExpirySweeper(const CommandExpirySweeper&)            = delete;
  CommandExpirySweeper& operator=(const CommandExpirySweeper&) = delete;

  void Start();
  void Stop();

  // One pass; returns the number of commands expired.
  std::size_t SweepOnce();

 private:
  void Run();

  std::shared_ptr<CommandQueue> queue_;
  std::chrono::milliseconds     ttl_;
  std::chrono::milliseconds     interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace relay::queue
