#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "bidsub/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using namespace bidsub::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  bidsubctl --config <file.yaml> rfp-add <rfp_id> <deadline: RFC 3339 or unix seconds> [title] [solicitation_number]\n"
            << "  bidsubctl --config <file.yaml> submit <rfp_id> <bid.yaml> <portal> [priority]\n"
            << "  bidsubctl --config <file.yaml> process\n"
            << "  bidsubctl --config <file.yaml> status <job_id>\n"
            << "  bidsubctl --config <file.yaml> retry <job_id>\n"
            << "  bidsubctl --config <file.yaml> stats\n"
            << "  bidsubctl --config <file.yaml> queue [queued|submitted|confirmed|failed]\n"
            << "  bidsubctl --config <file.yaml> audit <job_id>\n";
}

static std::optional<SubmissionStatus> ParseStatus(const std::string& value) {
  if (value == "queued") {
    return SUBMISSION_STATUS_QUEUED;
  }
  if (value == "submitted") {
    return SUBMISSION_STATUS_SUBMITTED;
  }
  if (value == "confirmed") {
    return SUBMISSION_STATUS_CONFIRMED;
  }
  if (value == "failed") {
    return SUBMISSION_STATUS_FAILED;
  }
  return std::nullopt;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to print " + std::string(message.GetDescriptor()->name()) + ": " + status.ToString());
  }
  std::cout << json;
}

static google::protobuf::Struct AuditToStruct(const bidsub::audit::AuditLogEntry& entry) {
  google::protobuf::Struct s;
  auto&                    fields = *s.mutable_fields();
  fields["job_id"].set_string_value(entry.job_id);
  fields["sequence"].set_number_value(static_cast<double>(entry.sequence));
  fields["event_type"].set_string_value(entry.event_type);
  fields["success"].set_bool_value(entry.success);
  *fields["details"].mutable_struct_value() = entry.details;
  if (entry.error_message) {
    fields["error_message"].set_string_value(*entry.error_message);
  }
  fields["timestamp"].set_string_value(bidsub::util::FormatTime(entry.timestamp));
  return s;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = bidsub::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }
    bidsub::observability::InitializeLogging(config);

    auto app = bidsub::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "rfp-add") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      bidsub::rfp::RfpInfo info;
      info.rfp_id              = argv[4];
      info.response_deadline   = bidsub::util::ParseTime(argv[5]);
      info.title               = argc >= 7 ? argv[6] : "";
      info.solicitation_number = argc >= 8 ? argv[7] : info.rfp_id;
      app.rfps->Upsert(info);

      std::cout << "rfp=" << info.rfp_id << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "submit") {
      if (argc < 7) {
        Usage();
        return 1;
      }

      auto    document = bidsub::config::ConfigLoader::LoadBidDocument(argv[5]);
      int32_t priority = argc >= 8 ? std::stoi(argv[7]) : 0;

      auto job = app.orchestrator->Submit(argv[4], document, argv[6], priority);
      PrintJson(app.orchestrator->GetJobStatus(job.job_id));
      std::cout << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "process") {
      app.orchestrator->Start();
      auto admitted = app.orchestrator->ProcessQueue();

      const bool idle = app.orchestrator->WaitForIdle(std::chrono::minutes(5));
      app.orchestrator->Stop();

      for (const auto& job_id : admitted) {
        PrintJson(app.orchestrator->GetJobStatus(job_id));
        std::cout << "\n";
      }
      if (!idle) {
        std::cerr << "deliveries still in flight after 5 minutes\n";
        app.notifications->Stop();
        return 2;
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "status") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      PrintJson(app.orchestrator->GetJobStatus(argv[4]));
      std::cout << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "retry") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      auto job = app.orchestrator->RetrySubmission(argv[4]);
      PrintJson(app.orchestrator->GetJobStatus(job.job_id));
      std::cout << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "stats") {
      PrintJson(app.orchestrator->GetStatistics());
      std::cout << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "queue") {
      std::optional<SubmissionStatus> filter;
      if (argc >= 5) {
        filter = ParseStatus(argv[4]);
        if (!filter) {
          std::cerr << "unsupported status: " << argv[4] << "\n";
          return 1;
        }
      }
      for (const auto& status : app.orchestrator->ListQueue(filter)) {
        PrintJson(status);
        std::cout << "\n";
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "audit") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      for (const auto& entry : app.orchestrator->AuditTrail(argv[4])) {
        PrintJson(AuditToStruct(entry));
        std::cout << "\n";
      }
    }

    // ------------------------------------------------------------

    else {
      Usage();
      return 1;
    }

    app.notifications->Stop();
    bidsub::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    bidsub::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
