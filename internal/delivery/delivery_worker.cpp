#include "delivery_worker.hpp"

#include "internal/observability/logging.hpp"

namespace bidsub::delivery {

DeliveryWorker::DeliveryWorker(std::shared_ptr<DeliveryScheduler> scheduler, DeliveryExecutor& executor)
    : scheduler_(std::move(scheduler)), executor_(executor) {
}

DeliveryWorker::~DeliveryWorker() {
  Stop();
}

void DeliveryWorker::Start() {
  running_ = true;
  thread_  = std::thread(&DeliveryWorker::Run, this);
}

void DeliveryWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void DeliveryWorker::Run() {
  while (running_) {
    auto job_id = scheduler_->Dequeue();
    if (!job_id) break;

    try {
      executor_.ExecuteAttempt(*job_id);
    } catch (const std::exception& e) {
      BIDSUB_LOG_ERROR("delivery attempt failed", {observability::StringField("job_id", *job_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace bidsub::delivery
