#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace bidsub::delivery {

/*
  Thread-safe blocking queue of admitted job ids for delivery workers.
*/
class DeliveryScheduler {
 public:
  void Enqueue(const std::string& job_id);

  // blocking wait; nullopt once shut down and drained
  std::optional<std::string> Dequeue();

  void Shutdown();

  size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool                    shutdown_ = false;
};

} // namespace bidsub::delivery
