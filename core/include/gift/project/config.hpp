// gift/project/config.hpp - Converter configuration (giftc.yaml)
//
// Parses and validates giftc.yaml. Every key is optional; a missing file
// simply means the defaults below.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace gift
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * GIFT reading options ('parse' section).
 */
struct ParseConfig
{
  /// Code points of question text used as the name when ::name:: is absent
  size_t name_length = 30;

  /// Name used when the question text is empty too
  std::string fallback_name = "Question";
};

/**
 * JSON output options ('json' section).
 */
struct JsonConfig
{
  /// Indentation of emitted JSON; negative values give compact output
  int indent = 2;
};

/**
 * GIFT writing options ('export' section).
 */
struct ExportConfig
{
  /// Prefix of answer lines inside {...}
  std::string indent = "\t";
};

struct GiftConfig
{
  ParseConfig parse;
  JsonConfig json;
  ExportConfig export_;

  /// File the configuration was read from (empty for defaults)
  std::filesystem::path source;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  GiftConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(GiftConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a giftc.yaml file.
 *
 * @param config_path Path to giftc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_config(const std::filesystem::path & config_path);

/**
 * Parse configuration from YAML text (used by load_config and tests).
 */
[[nodiscard]] ConfigLoadResult parse_config(const std::string & yaml_text);

/**
 * Find giftc.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to giftc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_config_file_name = "giftc.yaml";

}  // namespace gift
