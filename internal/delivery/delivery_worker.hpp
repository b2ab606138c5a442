#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "delivery_scheduler.hpp"

namespace bidsub::delivery {

// Runs one delivery attempt for an admitted job.
class DeliveryExecutor {
 public:
  virtual ~DeliveryExecutor() = default;

  virtual void ExecuteAttempt(const std::string& job_id) = 0;
};

/*
  Background worker draining the delivery queue.

  The executor must outlive the worker.
*/
class DeliveryWorker {
 public:
  DeliveryWorker(std::shared_ptr<DeliveryScheduler> scheduler, DeliveryExecutor& executor);
  ~DeliveryWorker();

  DeliveryWorker(const DeliveryWorker&)            = delete;
  DeliveryWorker& operator=(const DeliveryWorker&) = delete;

  void Start();

  // Shuts the shared scheduler down and joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<DeliveryScheduler> scheduler_;
  DeliveryExecutor&                  executor_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace bidsub::delivery
