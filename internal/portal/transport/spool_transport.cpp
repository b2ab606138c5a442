#include "spool_transport.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace bidsub::portal::transport {

namespace {

void ValidateComponent(const std::string& value, const char* what) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

// "https://api.sam.gov/submissions" -> "api.sam.gov_submissions"
std::string EndpointDirectory(const std::string& endpoint) {
  std::string trimmed = endpoint;
  if (auto scheme = trimmed.find("://"); scheme != std::string::npos) {
    trimmed = trimmed.substr(scheme + 3);
  }

  std::string out;
  for (char c : trimmed) {
    out.push_back(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' ? c : '_');
  }
  return out.empty() ? "default" : out;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("spool: cannot read " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

// write tmp -> flush -> rename; the tmp name is unique per writer so two
// processes sharing a spool never interleave into one file
void WriteAtomic(const std::filesystem::path& final_path, const std::string& data) {
  const std::filesystem::path tmp_path = final_path.string() + "." + util::GenerateUUIDString() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("spool: cannot open " + tmp_path.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw std::runtime_error("spool: write failed for " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw std::runtime_error("spool: rename to " + final_path.string() + " failed: " + ec.message());
  }
}

std::string ConfirmationFor(const std::string& prefix, const std::string& key) {
  std::string compact;
  for (char c : key) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      compact.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (compact.size() == 12) break;
  }
  return prefix + "-" + compact;
}

} // namespace

SpoolTransport::SpoolTransport(std::filesystem::path root, std::string confirmation_prefix)
    : root_(std::move(root)), confirmation_prefix_(std::move(confirmation_prefix)) {
  std::filesystem::create_directories(root_);
}

TransportResponse SpoolTransport::Post(const TransportRequest& request, std::chrono::milliseconds) {
  ValidateComponent(request.idempotency_key, "idempotency key");

  std::lock_guard lock(mutex_);

  const auto dir = root_ / EndpointDirectory(request.endpoint);
  std::filesystem::create_directories(dir);

  const auto receipt_path = dir / (request.idempotency_key + ".receipt");
  if (std::filesystem::exists(receipt_path)) {
    BIDSUB_LOG_INFO("spool: existing receipt", {observability::StringField("key", request.idempotency_key)});
    return {200, ReadFile(receipt_path)};
  }

  WriteAtomic(dir / (request.idempotency_key + ".json"), request.body);

  google::protobuf::Struct receipt;
  auto&                    fields = *receipt.mutable_fields();
  fields["status"].set_string_value("accepted");
  fields["confirmation_number"].set_string_value(ConfirmationFor(confirmation_prefix_, request.idempotency_key));
  fields["submission_key"].set_string_value(request.idempotency_key);

  std::string receipt_json;
  auto        status = google::protobuf::util::MessageToJsonString(receipt, &receipt_json);
  if (!status.ok()) {
    throw std::runtime_error("spool: receipt encoding failed: " + std::string(status.message()));
  }

  WriteAtomic(receipt_path, receipt_json);
  return {202, receipt_json};
}

} // namespace bidsub::portal::transport
