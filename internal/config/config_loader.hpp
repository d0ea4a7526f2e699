#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace market::config {

/*
  Effective task settings after defaults are applied.
*/
struct TaskSettings {
  util::Duration sync_interval       = std::chrono::minutes(5);
  util::Duration fast_retry_interval = std::chrono::seconds(3);
  int32_t        batch_cap           = 100;

  util::Duration rebuild_interval = std::chrono::minutes(1);

  util::Duration                force_resync_interval = std::chrono::hours(1);
  std::optional<util::Duration> admin_max_age;
  std::optional<util::Duration> user_max_age;
  std::optional<util::Duration> order_max_age;

  util::Duration request_timeout = std::chrono::seconds(10);
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static market::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml, from an in-memory document.
  static market::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws util::InvalidArgument on the first problem found.
  static void Validate(const market::runtime::config::RuntimeConfig& config);

  static TaskSettings Resolve(const market::runtime::config::RuntimeConfig& config);
};

} // namespace market::config
