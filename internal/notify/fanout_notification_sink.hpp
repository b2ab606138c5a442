#pragma once

#include <memory>
#include <vector>

#include "internal/notify/notification_sink.hpp"

namespace bidsub::notify {

// Delivers to every sink; one sink failing does not stop the others.
class FanoutNotificationSink final : public NotificationSink {
 public:
  explicit FanoutNotificationSink(std::vector<std::shared_ptr<NotificationSink>> sinks);

  void Notify(const std::string& event_type, const google::protobuf::Struct& payload) override;

 private:
  std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

} // namespace bidsub::notify
