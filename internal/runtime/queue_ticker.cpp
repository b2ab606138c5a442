#include "queue_ticker.hpp"

#include <exception>
#include <stdexcept>

#include "internal/core/submission_orchestrator.hpp"
#include "internal/observability/logging.hpp"

namespace bidsub::runtime {

QueueTicker::QueueTicker(std::shared_ptr<core::SubmissionOrchestrator> orchestrator, std::chrono::milliseconds interval)
    : orchestrator_(std::move(orchestrator)), interval_(interval) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("tick interval must be positive");
  }
}

QueueTicker::~QueueTicker() {
  Stop();
}

void QueueTicker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&QueueTicker::Loop, this);
}

void QueueTicker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void QueueTicker::Loop() {
  while (running_) {
    try {
      auto admitted = orchestrator_->ProcessQueue();
      if (!admitted.empty()) {
        BIDSUB_LOG_DEBUG("jobs admitted", {observability::IntField("count", static_cast<int64_t>(admitted.size()))});
      }
    } catch (const std::exception& e) {
      BIDSUB_LOG_ERROR("queue tick failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace bidsub::runtime
