#include "async_notification_sink.hpp"

#include "internal/observability/logging.hpp"

namespace bidsub::notify {

AsyncNotificationSink::AsyncNotificationSink(std::shared_ptr<NotificationSink> inner) : inner_(std::move(inner)) {
  thread_ = std::thread(&AsyncNotificationSink::Run, this);
}

AsyncNotificationSink::~AsyncNotificationSink() {
  Stop();
}

void AsyncNotificationSink::Notify(const std::string& event_type, const google::protobuf::Struct& payload) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      BIDSUB_LOG_WARN("notification dropped after shutdown", {observability::StringField("event", event_type)});
      return;
    }
    queue_.push(Pending{event_type, payload});
  }
  cv_.notify_one();
}

void AsyncNotificationSink::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return queue_.empty() && !dispatching_; });
}

void AsyncNotificationSink::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void AsyncNotificationSink::Run() {
  while (true) {
    Pending next;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });

      if (queue_.empty()) break;

      next = std::move(queue_.front());
      queue_.pop();
      dispatching_ = true;
    }

    try {
      inner_->Notify(next.event_type, next.payload);
    } catch (const std::exception& e) {
      BIDSUB_LOG_WARN("notification failed", {observability::StringField("event", next.event_type), observability::StringField("error", e.what())});
    }

    {
      std::lock_guard lock(mutex_);
      dispatching_ = false;
    }
    idle_cv_.notify_all();
  }

  idle_cv_.notify_all();
}

} // namespace bidsub::notify
