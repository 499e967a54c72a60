// gift/model/json_codec.hpp - Question <-> JSON interchange
//
// Encodes questions as a JSON array of objects, one per question, with
// TextWithFormat fields as {"text": ..., "format": ...}. The decoder is
// tolerant of hand-written documents: missing fields take the variant's
// defaults, the flat "questiontext"/"questiontextformat" shape is accepted
// and 0/1 integers stand in for booleans.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "gift/model/question.hpp"

namespace gift
{

[[nodiscard]] nlohmann::json question_to_json(const Question & question);
[[nodiscard]] nlohmann::json questions_to_json(const std::vector<Question> & questions);

/**
 * Decode one question object.
 *
 * @throws GiftError(UnsupportedVariant) for a missing or unknown qtype,
 *         GiftError(MalformedDocument) for fields of the wrong JSON type,
 *         GiftError(MalformedNumeric) for a numerical answer that is neither
 *         a number nor "*".
 */
[[nodiscard]] Question question_from_json(const nlohmann::json & object);

/// Decode a document; it must be an array of question objects.
[[nodiscard]] std::vector<Question> questions_from_json(const nlohmann::json & document);

/// Serialize to text; `indent` < 0 yields compact output.
[[nodiscard]] std::string dump_questions(const std::vector<Question> & questions, int indent = 2);

/// Parse JSON text and decode it; syntax errors become MalformedDocument.
[[nodiscard]] std::vector<Question> load_questions(std::string_view json_text);

}  // namespace gift
