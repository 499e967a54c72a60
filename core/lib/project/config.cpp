// gift/project/config.cpp - Converter configuration implementation
//
#include "gift/project/config.hpp"

#include <yaml-cpp/yaml.h>

namespace gift
{

namespace
{

/// A present section must be a map.
bool is_bad_section(const YAML::Node & node) { return node && !node.IsMap(); }

ConfigLoadResult from_node(const YAML::Node & root)
{
  GiftConfig config;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // 'parse' section
  const YAML::Node parse = root["parse"];
  if (is_bad_section(parse)) {
    return ConfigLoadResult::fail("parse must be a map");
  }
  if (parse) {
    if (parse["name_length"]) {
      const int length = parse["name_length"].as<int>();
      if (length <= 0) {
        return ConfigLoadResult::fail(
          "parse.name_length must be positive (got " + std::to_string(length) + ")");
      }
      config.parse.name_length = static_cast<size_t>(length);
    }
    if (parse["fallback_name"]) {
      config.parse.fallback_name = parse["fallback_name"].as<std::string>();
    }
  }

  // 'json' section
  const YAML::Node json = root["json"];
  if (is_bad_section(json)) {
    return ConfigLoadResult::fail("json must be a map");
  }
  if (json && json["indent"]) {
    config.json.indent = json["indent"].as<int>();
  }

  // 'export' section
  const YAML::Node exp = root["export"];
  if (is_bad_section(exp)) {
    return ConfigLoadResult::fail("export must be a map");
  }
  if (exp && exp["indent"]) {
    config.export_.indent = exp["indent"].as<std::string>();
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_config(const std::string & yaml_text)
{
  try {
    return from_node(YAML::Load(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result;
  try {
    result = from_node(root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(config_path.string() + ": " + std::string(e.what()));
  }
  if (result.success) {
    result.config.source = fs::absolute(config_path);
  }
  return result;
}

std::optional<std::filesystem::path> find_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace gift
