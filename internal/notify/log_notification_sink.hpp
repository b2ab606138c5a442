#pragma once

#include "internal/notify/notification_sink.hpp"

namespace bidsub::notify {

class LogNotificationSink final : public NotificationSink {
 public:
  void Notify(const std::string& event_type, const google::protobuf::Struct& payload) override;
};

} // namespace bidsub::notify
