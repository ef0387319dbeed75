#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace blobkeep::config {

namespace {

using google::protobuf::Value;

constexpr std::array<std::string_view, 4> kSynchronousModes = {"OFF", "NORMAL", "FULL", "EXTRA"};

// One year. The reaper's timed wait must stay inside steady_clock's range.
constexpr uint64_t kMaxSweepIntervalMs = 365ULL * 24 * 60 * 60 * 1000;

std::string Child(const std::string& path, const std::string& key) {
  return path.empty() ? key : path + "." + key;
}

// Quoted scalars are always strings; plain ones may be bools or numbers.
void SetScalar(const YAML::Node& node, Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (*end == '\0' && std::isfinite(number)) {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(text);
}

void ToValue(const YAML::Node& node, const std::string& path, Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      SetScalar(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        ToValue(node[i], path + "[" + std::to_string(i) + "]", list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: non-scalar key under '" + path + "'");
        }
        const auto& key = entry.first.Scalar();
        ToValue(entry.second, Child(path, key), &(*fields)[key]);
      }
      return;
    }

    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node at '" + path + "'");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

blobkeep::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: " + path + " must contain a mapping at the top level");
  }

  Value root;
  ToValue(yaml, "", &root);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  blobkeep::runtime::config::RuntimeConfig config;
  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration in " + path + ": " + std::string(parsed.message()));
  }

  return config;
}

void Validate(const blobkeep::runtime::config::RuntimeConfig& config) {
  if (config.store().base_dir().empty()) {
    throw std::invalid_argument("store.base_dir must be set");
  }

  const auto interval_ms = config.store().sweep_interval_ms();
  if (interval_ms > kMaxSweepIntervalMs) {
    throw std::invalid_argument("store.sweep_interval_ms must be at most " + std::to_string(kMaxSweepIntervalMs) + "; got " +
                                std::to_string(interval_ms));
  }

  if (!config.database().has_sqlite()) {
    return;
  }

  const auto& mode = config.database().sqlite().synchronous();
  if (mode.empty()) {
    return;
  }
  for (auto allowed : kSynchronousModes) {
    if (mode == allowed) {
      return;
    }
  }
  throw std::invalid_argument("database.sqlite.synchronous must be one of OFF, NORMAL, FULL, EXTRA; got '" + mode + "'");
}

} // namespace blobkeep::config
