#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "internal/notify/notification_sink.hpp"

namespace bidsub::notify {

/*
  Moves notification delivery off the caller's thread.

  Notify enqueues and returns. A single dispatcher thread forwards to the
  inner sink in order; failures are logged and dropped. Stop drains the
  queue before joining.
*/
class AsyncNotificationSink final : public NotificationSink {
 public:
  explicit AsyncNotificationSink(std::shared_ptr<NotificationSink> inner);
  ~AsyncNotificationSink() override;

  AsyncNotificationSink(const AsyncNotificationSink&)            = delete;
  AsyncNotificationSink& operator=(const AsyncNotificationSink&) = delete;

  void Notify(const std::string& event_type, const google::protobuf::Struct& payload) override;

  // Blocks until everything enqueued so far has been dispatched.
  void Flush();

  void Stop();

 private:
  struct Pending {
    std::string              event_type;
    google::protobuf::Struct payload;
  };

  void Run();

  std::shared_ptr<NotificationSink> inner_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<Pending>     queue_;
  bool                    stopping_    = false;
  bool                    dispatching_ = false;

  std::thread thread_;
};

} // namespace bidsub::notify
