#include "log_notification_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"

namespace bidsub::notify {

void LogNotificationSink::Notify(const std::string& event_type, const google::protobuf::Struct& payload) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    json = "{}";
  }

  BIDSUB_LOG_INFO("notification", {observability::StringField("event", event_type), observability::StringField("payload", json)});
}

} // namespace bidsub::notify
