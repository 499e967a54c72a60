// gift/syntax/grammar.hpp - Small GIFT sub-grammars
//
// Weight prefixes (%50%), numerical answer specs (1..3, 5:0.5, 7, *),
// leading format tags ([html]) and the [id:...]/[tag:...] annotations found
// in comment lines.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gift/basic/source_manager.hpp"
#include "gift/model/question.hpp"
#include "gift/syntax/scanned_text.hpp"

namespace gift::syntax
{

struct WeightPrefix
{
  double fraction = 0;  ///< percentage / 100, sign preserved
  ScannedText rest;     ///< text after the closing '%'
};

/**
 * Parse a leading `%w%`, `%-w%` or `%w.d%` prefix. The magnitude may not
 * exceed 100; anything else is not a weight and yields nullopt.
 */
[[nodiscard]] std::optional<WeightPrefix> parse_weight_prefix(const ScannedText & text);

/**
 * Trim `text` and consume a leading [moodle]/[html]/[plain]/[markdown] tag.
 * Unknown tags are left in place and the format stays `default_format`.
 */
[[nodiscard]] TextWithFormat parse_text_with_format(
  const ScannedText & text, TextFormat default_format);

/// Split on the first unescaped '#' into (answer, feedback), both with formats.
[[nodiscard]] std::pair<TextWithFormat, TextWithFormat> parse_commented(
  const ScannedText & text, TextFormat default_format);

struct NumericSpec
{
  std::optional<double> value;  ///< nullopt for the "*" wildcard
  double tolerance = 0;
};

/**
 * Interpret a numerical answer value: `a..b`, `a:t`, a bare number or `*`.
 *
 * @throws GiftError(MalformedNumeric) when a required number is missing or
 *         not finite; `range` is attached to the error.
 */
[[nodiscard]] NumericSpec parse_numeric_spec(std::string_view raw, SourceRange range = {});

/// Strict finite-number parse of a trimmed token.
[[nodiscard]] std::optional<double> parse_number(std::string_view text);

struct Metadata
{
  std::string idnumber;
  std::vector<std::string> tags;
};

/// First [id:...] and every [tag:...] in a comment buffer; `\]` is a literal ']'.
[[nodiscard]] Metadata extract_metadata(std::string_view comments);

/// Remove <...> markup.
[[nodiscard]] std::string strip_html_tags(std::string_view text);

/**
 * Name used when a block has no ::name:: — the first `max_chars` code points
 * of the tag-stripped question text, or `fallback` when that is empty.
 */
[[nodiscard]] std::string default_question_name(
  std::string_view questiontext, size_t max_chars, std::string_view fallback);

}  // namespace gift::syntax
