#include "fanout_notification_sink.hpp"

#include "internal/observability/logging.hpp"

namespace bidsub::notify {

FanoutNotificationSink::FanoutNotificationSink(std::vector<std::shared_ptr<NotificationSink>> sinks) : sinks_(std::move(sinks)) {
}

void FanoutNotificationSink::Notify(const std::string& event_type, const google::protobuf::Struct& payload) {
  for (const auto& sink : sinks_) {
    try {
      sink->Notify(event_type, payload);
    } catch (const std::exception& e) {
      BIDSUB_LOG_WARN("notification channel failed", {observability::StringField("event", event_type), observability::StringField("error", e.what())});
    }
  }
}

} // namespace bidsub::notify
