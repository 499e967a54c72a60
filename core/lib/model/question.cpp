// gift/model/question.cpp
#include "gift/model/question.hpp"

#include <array>
#include <cctype>

namespace gift
{

namespace
{

bool iequals(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<TextFormat> parse_text_format(std::string_view name) noexcept
{
  constexpr std::array<TextFormat, 4> k_formats = {
    TextFormat::Moodle, TextFormat::Html, TextFormat::Plain, TextFormat::Markdown};
  for (const TextFormat f : k_formats) {
    if (iequals(name, to_string(f))) {
      return f;
    }
  }
  return std::nullopt;
}

std::optional<QuestionType> parse_question_type(std::string_view name) noexcept
{
  constexpr std::array<QuestionType, 8> k_types = {
    QuestionType::Category,    QuestionType::Description, QuestionType::Essay,
    QuestionType::Multichoice, QuestionType::Match,       QuestionType::TrueFalse,
    QuestionType::ShortAnswer, QuestionType::Numerical};
  for (const QuestionType t : k_types) {
    if (name == to_string(t)) {
      return t;
    }
  }
  return std::nullopt;
}

}  // namespace gift
