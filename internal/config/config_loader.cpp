#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace ridedispatch::config {

using ridedispatch::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars stay strings ("10" for a string field)
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) ToValue(item, list->add_values());
      return;
    }
    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) ToValue(entry.second, &(*fields)[entry.first.Scalar()]);
      return;
    }
  }
  throw std::runtime_error("unsupported YAML node");
}

RuntimeConfig FromYamlNode(const YAML::Node& root) {
  RuntimeConfig config;
  // an empty document is an all-defaults config
  if (root.IsNull()) {
    ConfigLoader::Normalize(config);
    return config;
  }
  if (!root.IsMap()) throw util::InvalidArgument("config root must be a mapping");

  google::protobuf::Value value;
  ToValue(root, &value);

  std::string json;
  auto        printed = google::protobuf::util::MessageToJsonString(value, &json);
  if (!printed.ok()) {
    throw std::runtime_error("failed to serialize YAML to JSON: " + std::string(printed.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw util::InvalidArgument("invalid configuration: " + std::string(parsed.message()));
  }

  ConfigLoader::Normalize(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(root);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("failed to parse YAML config: ") + e.what());
  }
  return FromYamlNode(root);
}

void ConfigLoader::Normalize(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config.mutable_database();
  switch (database->backend_case()) {
    case ridedispatch::runtime::config::DatabaseConfig::BACKEND_NOT_SET:
      database->mutable_memory();
      break;
    case ridedispatch::runtime::config::DatabaseConfig::kSqlite:
      if (database->sqlite().path().empty()) throw util::InvalidArgument("database.sqlite.path is required");
      break;
    case ridedispatch::runtime::config::DatabaseConfig::kPostgres:
      if (database->postgres().connection_uri().empty()) {
        throw util::InvalidArgument("database.postgres.connection_uri is required");
      }
      break;
    case ridedispatch::runtime::config::DatabaseConfig::kMemory:
      break;
  }

  const auto& transport = config.observability().transport();
  if (!transport.empty() && transport != "grpc" && transport != "http" && transport != "http/protobuf") {
    throw util::InvalidArgument("observability.transport must be grpc, http or http/protobuf");
  }
}

} // namespace ridedispatch::config
