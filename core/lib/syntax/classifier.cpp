#include "gift/syntax/classifier.hpp"

#include <cctype>
#include <string>

namespace gift::syntax
{

namespace
{

std::string to_upper(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace

bool is_truefalse_token(std::string_view token)
{
  const std::string upper = to_upper(token);
  return upper == "T" || upper == "TRUE" || upper == "F" || upper == "FALSE";
}

bool is_true_token(std::string_view token)
{
  const std::string upper = to_upper(token);
  return upper == "T" || upper == "TRUE";
}

QuestionType classify_answer_body(const ScannedText & body)
{
  if (body.empty()) {
    return QuestionType::Essay;
  }
  if (body.is_syntax(0, '#')) {
    return QuestionType::Numerical;
  }
  if (body.contains('~')) {
    return QuestionType::Multichoice;
  }
  if (body.contains('=') && body.contains("->")) {
    return QuestionType::Match;
  }
  const ScannedText verdict = body.split('#', 2).front().trimmed();
  if (is_truefalse_token(verdict.str())) {
    return QuestionType::TrueFalse;
  }
  return QuestionType::ShortAnswer;
}

}  // namespace gift::syntax
