#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace bidsub::config {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

namespace {

void YamlToProtoValue(const YAML::Node& node, const Descriptor* message, const FieldDescriptor* field,
                      google::protobuf::Value* value);

// Fields whose JSON form is a string even when the YAML scalar looks numeric.
bool WantsString(const FieldDescriptor* field) {
  if (field == nullptr) return false;

  switch (field->cpp_type()) {
    case FieldDescriptor::CPPTYPE_STRING:
      return true;
    case FieldDescriptor::CPPTYPE_MESSAGE: {
      const auto& name = field->message_type()->full_name();
      return name == "google.protobuf.Duration" || name == "google.protobuf.Timestamp";
    }
    default:
      return false;
  }
}

void SetScalarValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted, !!str tagged, or bound for a string field: never reinterpreted
  if (node.Tag() == "!" || node.Tag() == "tag:yaml.org,2002:str" || WantsString(field)) {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void MapToStruct(const YAML::Node& node, const Descriptor* message, const FieldDescriptor* field,
                 google::protobuf::Value* value) {
  // proto map<> entries: every value is typed by the entry's value field
  const FieldDescriptor* map_value = nullptr;
  if (field != nullptr && field->is_map()) {
    map_value = field->message_type()->FindFieldByName("value");
  }

  auto* fields = value->mutable_struct_value()->mutable_fields();
  for (const auto& it : node) {
    const auto             key   = it.first.Scalar();
    const FieldDescriptor* child = map_value;
    if (child == nullptr && message != nullptr) {
      child = message->FindFieldByName(key);
      // Descriptor::FindFieldByJsonName is not available in protobuf 3.21
      for (int i = 0; child == nullptr && i < message->field_count(); ++i) {
        if (message->field(i)->json_name() == key) child = message->field(i);
      }
    }

    const Descriptor* child_message =
        child != nullptr && child->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE ? child->message_type() : nullptr;
    YamlToProtoValue(it.second, child_message, child, &(*fields)[key]);
  }
}

void YamlToProtoValue(const YAML::Node& node, const Descriptor* message, const FieldDescriptor* field,
                      google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, message, field, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map:
      MapToStruct(node, message, field, value);
      break;
  }
}

} // namespace

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

void ConfigLoader::LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML " + path + ": " + std::string(e.what()));
  }

  const auto* descriptor = message->GetDescriptor();

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, descriptor, nullptr, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid " + descriptor->name() + " in " + path + ": " + std::string(status.message()));
  }
}

bidsub::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  bidsub::runtime::config::RuntimeConfig config;
  LoadMessageFromYaml(path, &config);
  return config;
}

bidsub::v1::BidDocument ConfigLoader::LoadBidDocument(const std::string& path) {
  bidsub::v1::BidDocument document;
  LoadMessageFromYaml(path, &document);
  return document;
}

} // namespace bidsub::config
