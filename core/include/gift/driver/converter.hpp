// gift/driver/converter.hpp - Conversion driver
//
// Single entry point for GIFT -> JSON and JSON -> GIFT conversion.
// Used by the CLI; core errors come back as diagnostics instead of exceptions.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "gift/basic/diagnostic.hpp"
#include "gift/basic/error.hpp"
#include "gift/basic/source_manager.hpp"
#include "gift/project/config.hpp"

namespace gift
{

// ============================================================================
// Convert Mode
// ============================================================================

enum class ConvertMode {
  Parse,   ///< GIFT text -> JSON document
  Export,  ///< JSON document -> GIFT text
};

// ============================================================================
// Convert Options
// ============================================================================

struct ConvertOptions
{
  ConvertMode mode = ConvertMode::Parse;

  /// Settings from giftc.yaml (defaults when there is none)
  GiftConfig config;

  /// Write the result here; when unset the caller takes ConvertResult::output
  std::optional<std::filesystem::path> output_path;

  bool verbose = false;
};

// ============================================================================
// Convert Result
// ============================================================================

struct ConvertResult
{
  /// Whether conversion succeeded (no errors)
  bool success = false;

  /// Collected diagnostics
  DiagnosticBag diagnostics;

  /// Converted document (JSON or GIFT text)
  std::string output;

  size_t question_count = 0;

  /// Input as parsed (newlines normalized); diagnostic ranges point into it
  SourceFile source;
};

// ============================================================================
// Converter
// ============================================================================

/**
 * Runs one conversion. Any error aborts it: a single malformed question
 * fails the whole document and `output` stays empty.
 */
class Converter
{
public:
  /// GIFT text -> JSON text.
  [[nodiscard]] static ConvertResult parse_text(
    std::string_view gift_text, const GiftConfig & config,
    const std::filesystem::path & name = "<input>");

  /// JSON text -> GIFT text.
  [[nodiscard]] static ConvertResult export_text(
    std::string_view json_text, const GiftConfig & config,
    const std::filesystem::path & name = "<input>");

  /// Read `input`, convert it per `options.mode` and write options.output_path if set.
  [[nodiscard]] static ConvertResult convert_file(
    const std::filesystem::path & input, const ConvertOptions & options);

  /// @throws GiftError(Io) when the file cannot be read
  [[nodiscard]] static std::string read_file(const std::filesystem::path & path);

  /// @throws GiftError(Io) when the file cannot be written
  static void write_file(const std::filesystem::path & path, std::string_view content);

private:
  /// Turn a core error into a diagnostic in `diags`.
  static void report(DiagnosticBag & diags, const GiftError & error);
};

}  // namespace gift
