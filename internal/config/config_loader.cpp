#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace market::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

static market::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  market::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static bool IsPositive(const google::protobuf::Duration& d) {
  return d.seconds() > 0 || (d.seconds() == 0 && d.nanos() > 0);
}

static void RequirePositive(bool present, const google::protobuf::Duration& d, const char* name) {
  if (present && !IsPositive(d)) {
    throw util::InvalidArgument(std::string(name) + " must be positive");
  }
}

static std::optional<util::Duration> OptionalDuration(bool present, const google::protobuf::Duration& d) {
  if (!present) {
    return std::nullopt;
  }
  return util::FromProto(d, util::Duration::zero());
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

market::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

market::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& document) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(document);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const market::runtime::config::RuntimeConfig& config) {
  const auto& chain = config.chain();
  if (chain.master_address().find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::InvalidArgument("chain.master_address is required");
  }
  RequirePositive(chain.has_request_timeout(), chain.request_timeout(), "chain.request_timeout");

  const auto& sync = config.sync();
  if (sync.has_batch_cap() && sync.batch_cap() <= 0) {
    throw util::InvalidArgument("sync.batch_cap must be positive");
  }
  RequirePositive(sync.has_interval(), sync.interval(), "sync.interval");
  RequirePositive(sync.has_fast_retry_interval(), sync.fast_retry_interval(), "sync.fast_retry_interval");

  RequirePositive(config.cache().has_rebuild_interval(), config.cache().rebuild_interval(), "cache.rebuild_interval");

  const auto& resync = config.force_resync();
  RequirePositive(resync.has_check_interval(), resync.check_interval(), "force_resync.check_interval");
  RequirePositive(resync.has_admin_max_age(), resync.admin_max_age(), "force_resync.admin_max_age");
  RequirePositive(resync.has_user_max_age(), resync.user_max_age(), "force_resync.user_max_age");
  RequirePositive(resync.has_order_max_age(), resync.order_max_age(), "force_resync.order_max_age");

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path is required");
  }
}

TaskSettings ConfigLoader::Resolve(const market::runtime::config::RuntimeConfig& config) {
  TaskSettings settings;

  settings.sync_interval       = util::FromProto(config.sync().interval(), settings.sync_interval);
  settings.fast_retry_interval = util::FromProto(config.sync().fast_retry_interval(), settings.fast_retry_interval);
  if (config.sync().has_batch_cap()) {
    settings.batch_cap = config.sync().batch_cap();
  }

  settings.rebuild_interval = util::FromProto(config.cache().rebuild_interval(), settings.rebuild_interval);

  const auto& resync             = config.force_resync();
  settings.force_resync_interval = util::FromProto(resync.check_interval(), settings.force_resync_interval);
  settings.admin_max_age         = OptionalDuration(resync.has_admin_max_age(), resync.admin_max_age());
  settings.user_max_age          = OptionalDuration(resync.has_user_max_age(), resync.user_max_age());
  settings.order_max_age         = OptionalDuration(resync.has_order_max_age(), resync.order_max_age());

  settings.request_timeout = util::FromProto(config.chain().request_timeout(), settings.request_timeout);
  return settings;
}

} // namespace market::config
