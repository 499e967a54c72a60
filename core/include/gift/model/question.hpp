// gift/model/question.hpp - Format-neutral question representation
//
// A Question is produced whole from one GIFT block (or one JSON object) and
// is treated as an immutable value afterwards. The variant-specific fields
// live in `body`, whose alternative order mirrors QuestionType.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gift
{

// ============================================================================
// TextFormat / TextWithFormat
// ============================================================================

/// Rich-text encoding tag. Never interpreted, only carried through.
enum class TextFormat : uint8_t {
  Moodle,
  Html,
  Plain,
  Markdown,
};

[[nodiscard]] constexpr std::string_view to_string(TextFormat f) noexcept
{
  switch (f) {
    case TextFormat::Moodle:
      return "moodle";
    case TextFormat::Html:
      return "html";
    case TextFormat::Plain:
      return "plain";
    case TextFormat::Markdown:
      return "markdown";
  }
  return "moodle";
}

/// Case-insensitive lookup; nullopt for anything but the four known names.
[[nodiscard]] std::optional<TextFormat> parse_text_format(std::string_view name) noexcept;

struct TextWithFormat
{
  std::string text;
  TextFormat format = TextFormat::Moodle;

  [[nodiscard]] bool operator==(const TextWithFormat & other) const
  {
    return text == other.text && format == other.format;
  }
  [[nodiscard]] bool operator!=(const TextWithFormat & other) const { return !(*this == other); }
};

// ============================================================================
// QuestionType
// ============================================================================

enum class QuestionType : uint8_t {
  Category,
  Description,
  Essay,
  Multichoice,
  Match,
  TrueFalse,
  ShortAnswer,
  Numerical,
};

[[nodiscard]] constexpr std::string_view to_string(QuestionType t) noexcept
{
  switch (t) {
    case QuestionType::Category:
      return "category";
    case QuestionType::Description:
      return "description";
    case QuestionType::Essay:
      return "essay";
    case QuestionType::Multichoice:
      return "multichoice";
    case QuestionType::Match:
      return "match";
    case QuestionType::TrueFalse:
      return "truefalse";
    case QuestionType::ShortAnswer:
      return "shortanswer";
    case QuestionType::Numerical:
      return "numerical";
  }
  return "";
}

[[nodiscard]] std::optional<QuestionType> parse_question_type(std::string_view name) noexcept;

// ============================================================================
// Variant bodies
// ============================================================================

struct CategoryBody
{
  std::string category;
};

struct DescriptionBody
{
  double defaultmark = 0;
  int length = 0;
};

/// Fixed grading/response configuration of an essay question.
struct EssayBody
{
  std::string responseformat = "editor";
  int responserequired = 1;
  int responsefieldlines = 15;
  int attachments = 0;
  int attachmentsrequired = 0;
  TextWithFormat graderinfo{"", TextFormat::Html};
  TextWithFormat responsetemplate{"", TextFormat::Html};
};

struct ChoiceAnswer
{
  TextWithFormat answer;
  double fraction = 0;  ///< signed weight in [-1, 1]
  TextWithFormat feedback;
};

struct MultichoiceBody
{
  bool single = false;
  std::string answernumbering = "abc";
  std::vector<ChoiceAnswer> answers;
};

struct MatchPair
{
  TextWithFormat questiontext;
  std::string answertext;
};

struct MatchBody
{
  std::vector<MatchPair> subquestions;
};

struct TrueFalseBody
{
  bool correctanswer = false;
  TextWithFormat feedbacktrue;
  TextWithFormat feedbackfalse;
  double penalty = 1;
};

struct ShortAnswer
{
  std::string answer;
  double fraction = 1;
  TextWithFormat feedback;
};

struct ShortAnswerBody
{
  std::vector<ShortAnswer> answers;
};

struct NumericalAnswer
{
  /// Expected value; nullopt is the "*" catch-all entry.
  std::optional<double> value;
  double tolerance = 0;
  double fraction = 1;
  TextWithFormat feedback;

  [[nodiscard]] bool is_wildcard() const noexcept { return !value.has_value(); }
};

struct NumericalBody
{
  std::vector<NumericalAnswer> answers;
};

using QuestionBody = std::variant<
  CategoryBody, DescriptionBody, EssayBody, MultichoiceBody, MatchBody, TrueFalseBody,
  ShortAnswerBody, NumericalBody>;

// ============================================================================
// Question
// ============================================================================

struct Question
{
  std::string id;  ///< external identifier, echoed in the export header only
  std::string name;
  TextWithFormat questiontext;
  TextWithFormat generalfeedback;
  std::string idnumber;
  std::vector<std::string> tags;
  QuestionBody body;

  [[nodiscard]] QuestionType qtype() const noexcept
  {
    return static_cast<QuestionType>(body.index());
  }

  template <typename Body>
  [[nodiscard]] const Body * get_if() const noexcept
  {
    return std::get_if<Body>(&body);
  }
};

}  // namespace gift
