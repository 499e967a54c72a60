// gift/syntax/classifier.hpp - Answer span -> question variant
#pragma once

#include <string_view>

#include "gift/model/question.hpp"
#include "gift/syntax/scanned_text.hpp"

namespace gift::syntax
{

/**
 * Decide the variant of a braced question from its answer body (the span
 * between the braces, trimmed, general feedback removed). First match wins:
 *
 *   empty                         -> Essay
 *   starts with '#'               -> Numerical
 *   contains '~'                  -> Multichoice
 *   contains '=' and "->"         -> Match
 *   T / TRUE / F / FALSE (before
 *   any '#', case-insensitive)    -> TrueFalse
 *   anything else                 -> ShortAnswer
 *
 * Only unescaped characters count. Blocks without braces (Description) and
 * $CATEGORY lines never reach the classifier.
 */
[[nodiscard]] QuestionType classify_answer_body(const ScannedText & body);

/// True for the verdict tokens T, TRUE, F, FALSE in any case.
[[nodiscard]] bool is_truefalse_token(std::string_view token);

/// True for T and TRUE in any case.
[[nodiscard]] bool is_true_token(std::string_view token);

}  // namespace gift::syntax
