// gift/syntax/parser.hpp - GIFT document -> questions
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gift/basic/source_manager.hpp"
#include "gift/model/question.hpp"
#include "gift/syntax/scanned_text.hpp"
#include "gift/syntax/segmenter.hpp"

namespace gift::syntax
{

struct ParseOptions
{
  /// Characters of question text used as the name when ::name:: is absent.
  size_t name_length = 30;

  /// Name used when the question text is empty as well.
  std::string fallback_name = "Question";
};

/**
 * Parses GIFT question blocks.
 *
 * Any malformed block throws GiftError and aborts the whole document; there
 * is no partial result. Callers wanting per-block tolerance can drive
 * parse_block() themselves.
 */
class Parser
{
public:
  explicit Parser(ParseOptions options = {}) : options_(std::move(options)) {}

  /// Parse a document whose newlines are already normalized.
  [[nodiscard]] std::vector<Question> parse_document(std::string_view normalized) const;

  /// nullopt for blocks that hold nothing but comments.
  [[nodiscard]] std::optional<Question> parse_block(const RawBlock & block) const;

private:
  [[nodiscard]] static Question parse_category(const ScannedText & text);

  [[nodiscard]] static MultichoiceBody parse_multichoice(
    const ScannedText & body, TextFormat format, SourceRange range);
  [[nodiscard]] static MatchBody parse_match(
    const ScannedText & body, TextFormat format, SourceRange range);
  [[nodiscard]] static TrueFalseBody parse_truefalse(const ScannedText & body, TextFormat format);
  [[nodiscard]] static ShortAnswerBody parse_shortanswer(
    const ScannedText & body, TextFormat format, SourceRange range);
  [[nodiscard]] static NumericalBody parse_numerical(
    const ScannedText & body, TextFormat format, SourceRange range);

  ParseOptions options_;
};

/// Normalize newlines and parse a whole GIFT document.
[[nodiscard]] std::vector<Question> parse_gift(
  std::string_view text, const ParseOptions & options = {});

}  // namespace gift::syntax
