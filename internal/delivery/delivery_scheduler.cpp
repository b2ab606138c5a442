#include "delivery_scheduler.hpp"

namespace bidsub::delivery {

void DeliveryScheduler::Enqueue(const std::string& job_id) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(job_id);
  }
  cv_.notify_one();
}

std::optional<std::string> DeliveryScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  std::string job_id = std::move(queue_.front());
  queue_.pop();
  return job_id;
}

void DeliveryScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t DeliveryScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace bidsub::delivery
