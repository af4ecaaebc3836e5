#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys
  are rejected so a typo never silently falls back to a default.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws util::InvalidArgument on settings no default can repair.
  static void Validate(const ledger::runtime::config::RuntimeConfig& config);
};

} // namespace ledger::config
