#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace bidsub::core {
class SubmissionOrchestrator;
}

namespace bidsub::runtime {

/*
  Periodically asks the orchestrator to admit queued jobs.

  A failed tick is logged and the next tick runs as usual; an audit fault
  keeps failing until the operator intervenes.
*/
class QueueTicker {
 public:
  QueueTicker(std::shared_ptr<core::SubmissionOrchestrator> orchestrator, std::chrono::milliseconds interval);
  ~QueueTicker();

  QueueTicker(const QueueTicker&)            = delete;
  QueueTicker& operator=(const QueueTicker&) = delete;

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<core::SubmissionOrchestrator> orchestrator_;
  std::chrono::milliseconds                     interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace bidsub::runtime
