#pragma once

#include <string>

#include "config/config.pb.h"

namespace ridedispatch::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, printed as JSON and parsed
  into the message, so durations are written the protobuf JSON way ("120s")
  and unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static ridedispatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static ridedispatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Fills server/database defaults and rejects inconsistent sections.
  static void Normalize(ridedispatch::runtime::config::RuntimeConfig& config);
};

} // namespace ridedispatch::config
