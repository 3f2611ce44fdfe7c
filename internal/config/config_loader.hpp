#pragma once

#include <string>

#include "config/config.pb.h"

namespace liveviewer::config {

inline constexpr uint32_t kDefaultQueueCapacity     = 2000;
inline constexpr uint32_t kDefaultBatchSize         = 1000;
inline constexpr uint32_t kDefaultPauseEveryPages   = 5;
inline constexpr uint32_t kDefaultPagePauseMs       = 500;
inline constexpr uint32_t kDefaultSqlitePoolSize    = 4;
inline constexpr uint32_t kDefaultConsistencySample = 2;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero-valued tunables are replaced by their defaults.
*/
class ConfigLoader {
 public:
  static liveviewer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static liveviewer::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(liveviewer::runtime::config::RuntimeConfig& config);
};

} // namespace liveviewer::config
