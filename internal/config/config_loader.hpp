#pragma once

#include <string>

#include "config/config.pb.h"

namespace blobkeep::config {

/*
  Reads blobkeepctl's YAML configuration.

  The YAML tree is converted to a google.protobuf.Value, rendered as
  JSON and parsed into RuntimeConfig, so the .proto schema is the only
  place fields are declared. Unknown keys are errors.
*/
class ConfigLoader {
 public:
  static blobkeep::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Throws std::invalid_argument describing the first problem found.
void Validate(const blobkeep::runtime::config::RuntimeConfig& config);

} // namespace blobkeep::config
