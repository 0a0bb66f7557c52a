#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys and
  out-of-range values are rejected with std::runtime_error.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void Validate(const ledger::runtime::config::RuntimeConfig& config);
};

} // namespace ledger::config
