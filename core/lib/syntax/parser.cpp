#include "gift/syntax/parser.hpp"

#include <utility>

#include "gift/basic/error.hpp"
#include "gift/syntax/classifier.hpp"
#include "gift/syntax/grammar.hpp"

namespace gift::syntax
{

namespace
{

constexpr std::string_view k_category_marker = "$CATEGORY:";
constexpr std::string_view k_name_marker = "::";
constexpr std::string_view k_general_feedback_marker = "####";
constexpr std::string_view k_blank_placeholder = "_____";
constexpr std::string_view k_match_arrow = "->";

TextWithFormat empty_text(TextFormat format) { return TextWithFormat{"", format}; }

}  // namespace

// ============================================================================
// Document
// ============================================================================

std::vector<Question> Parser::parse_document(std::string_view normalized) const
{
  std::vector<Question> questions;
  for (const auto & block : segment_blocks(normalized)) {
    if (auto question = parse_block(block)) {
      questions.push_back(std::move(*question));
    }
  }
  return questions;
}

std::optional<Question> Parser::parse_block(const RawBlock & block) const
{
  if (!block.has_content()) {
    return std::nullopt;
  }

  ScannedText text = ScannedText::scan(block.body).trimmed();
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.starts_with(k_category_marker)) {
    return parse_category(text.substr(k_category_marker.size()));
  }

  Question question;
  bool has_name = false;
  if (text.starts_with(k_name_marker)) {
    const size_t close = text.find(k_name_marker, k_name_marker.size());
    if (close != ScannedText::npos) {
      question.name = text.substr(k_name_marker.size(), close - k_name_marker.size()).str();
      text = text.substr(close + k_name_marker.size()).trimmed();
      has_name = true;
    }
  }

  const size_t open = text.find('{');
  const size_t close = text.rfind('}');
  const bool has_open = open != ScannedText::npos;
  const bool has_close = close != ScannedText::npos;

  ScannedText answer_body;
  std::optional<ScannedText> feedback_text;
  bool braced = false;

  if (has_open || has_close) {
    if (!has_open || !has_close || close < open) {
      throw GiftError(
        ErrorKind::BraceMismatch, "brace error in question: " + text.str(), block.range);
    }
    braced = true;

    ScannedText span = text.substr(open + 1, close - open - 1).trimmed();
    ScannedText prefix = text.substr(0, open);
    const ScannedText suffix = text.substr(close + 1);
    if (!suffix.empty()) {
      prefix.append(ScannedText(k_blank_placeholder));
    }
    prefix.append(suffix);
    text = std::move(prefix);

    const size_t marker = span.rfind(k_general_feedback_marker);
    if (marker != ScannedText::npos) {
      feedback_text = span.substr(marker + k_general_feedback_marker.size());
      span = span.substr(0, marker).trimmed();
    }
    answer_body = std::move(span);
  }

  question.questiontext = parse_text_with_format(text, TextFormat::Moodle);
  const TextFormat format = question.questiontext.format;
  question.generalfeedback =
    feedback_text ? parse_text_with_format(*feedback_text, format) : empty_text(format);

  if (!has_name) {
    question.name = default_question_name(
      question.questiontext.text, options_.name_length, options_.fallback_name);
  }

  Metadata meta = extract_metadata(block.comments);
  question.idnumber = std::move(meta.idnumber);
  question.tags = std::move(meta.tags);

  if (!braced) {
    question.body = DescriptionBody{};
    return question;
  }

  switch (classify_answer_body(answer_body)) {
    case QuestionType::Essay:
      question.body = EssayBody{};
      break;
    case QuestionType::Numerical:
      question.body = parse_numerical(answer_body, format, block.range);
      break;
    case QuestionType::Multichoice:
      question.body = parse_multichoice(answer_body, format, block.range);
      break;
    case QuestionType::Match:
      question.body = parse_match(answer_body, format, block.range);
      break;
    case QuestionType::TrueFalse:
      question.body = parse_truefalse(answer_body, format);
      break;
    case QuestionType::ShortAnswer:
      question.body = parse_shortanswer(answer_body, format, block.range);
      break;
    case QuestionType::Category:
    case QuestionType::Description:
      // Never produced for a braced body.
      question.body = DescriptionBody{};
      break;
  }
  return question;
}

Question Parser::parse_category(const ScannedText & text)
{
  const size_t eol = text.find('\n');
  Question question;
  question.body = CategoryBody{text.substr(0, eol).trimmed().str()};
  return question;
}

// ============================================================================
// Variants
// ============================================================================

MultichoiceBody Parser::parse_multichoice(
  const ScannedText & body, TextFormat format, SourceRange range)
{
  MultichoiceBody out;
  out.single = body.contains('=');

  const auto alternatives = body.replace_all('=', "~=").split_nonempty('~');
  if (alternatives.size() < 2) {
    throw GiftError(
      ErrorKind::InsufficientAlternatives,
      "multichoice question needs at least two answers: " + body.str(), range);
  }

  for (const auto & alternative : alternatives) {
    ChoiceAnswer answer;
    ScannedText rest = alternative;
    if (alternative.is_syntax(0, '=')) {
      answer.fraction = 1;
      rest = alternative.substr(1);
    } else if (auto weight = parse_weight_prefix(alternative)) {
      answer.fraction = weight->fraction;
      rest = std::move(weight->rest);
    }
    auto [text, feedback] = parse_commented(rest, format);
    answer.answer = std::move(text);
    answer.feedback = std::move(feedback);
    out.answers.push_back(std::move(answer));
  }
  return out;
}

MatchBody Parser::parse_match(const ScannedText & body, TextFormat format, SourceRange range)
{
  const auto parts = body.split_nonempty('=');
  if (parts.size() < 2) {
    throw GiftError(
      ErrorKind::InsufficientAlternatives,
      "matching question needs at least two pairs: " + body.str(), range);
  }

  MatchBody out;
  for (const auto & part : parts) {
    const size_t arrow = part.find(k_match_arrow);
    if (arrow == ScannedText::npos) {
      throw GiftError(
        ErrorKind::MissingSeparator, "matching pair without '->': " + part.str(), range);
    }
    MatchPair pair;
    pair.questiontext = parse_text_with_format(part.substr(0, arrow), format);
    pair.answertext = part.substr(arrow + k_match_arrow.size()).trimmed().str();
    out.subquestions.push_back(std::move(pair));
  }
  return out;
}

TrueFalseBody Parser::parse_truefalse(const ScannedText & body, TextFormat format)
{
  const auto parts = body.split('#', 3);

  TrueFalseBody out;
  out.correctanswer = is_true_token(parts[0].trimmed().str());

  const TextWithFormat wrong =
    parts.size() > 1 ? parse_text_with_format(parts[1], format) : empty_text(format);
  const TextWithFormat right =
    parts.size() > 2 ? parse_text_with_format(parts[2], format) : empty_text(format);

  out.feedbacktrue = out.correctanswer ? right : wrong;
  out.feedbackfalse = out.correctanswer ? wrong : right;
  return out;
}

ShortAnswerBody Parser::parse_shortanswer(
  const ScannedText & body, TextFormat format, SourceRange range)
{
  const auto parts = body.split_nonempty('=');
  if (parts.empty()) {
    throw GiftError(
      ErrorKind::InsufficientAlternatives,
      "short answer question needs at least one answer: " + body.str(), range);
  }

  ShortAnswerBody out;
  for (const auto & part : parts) {
    ShortAnswer answer;
    ScannedText rest = part;
    if (auto weight = parse_weight_prefix(part)) {
      answer.fraction = weight->fraction;
      rest = std::move(weight->rest);
    }
    auto [text, feedback] = parse_commented(rest, format);
    answer.answer = std::move(text.text);
    answer.feedback = std::move(feedback);
    out.answers.push_back(std::move(answer));
  }
  return out;
}

NumericalBody Parser::parse_numerical(
  const ScannedText & body, TextFormat format, SourceRange range)
{
  ScannedText rest = body.substr(1);

  std::optional<NumericalAnswer> wildcard;
  if (const size_t tilde = rest.find('~'); tilde != ScannedText::npos) {
    NumericalAnswer entry;
    entry.fraction = 0;
    entry.feedback = parse_commented(rest.substr(tilde + 1), format).second;
    wildcard = std::move(entry);
    rest = rest.substr(0, tilde);
  }

  const auto parts = rest.split_nonempty('=');
  if (parts.empty()) {
    throw GiftError(
      ErrorKind::InsufficientAlternatives,
      "numerical question needs at least one answer: " + body.str(), range);
  }

  NumericalBody out;
  for (const auto & part : parts) {
    NumericalAnswer answer;
    ScannedText value_text = part;
    if (auto weight = parse_weight_prefix(part)) {
      answer.fraction = weight->fraction;
      value_text = std::move(weight->rest);
    }
    auto [value, feedback] = parse_commented(value_text, format);
    const NumericSpec spec = parse_numeric_spec(value.text, range);
    answer.value = spec.value;
    answer.tolerance = spec.tolerance;
    answer.feedback = std::move(feedback);
    out.answers.push_back(std::move(answer));
  }

  if (wildcard) {
    out.answers.push_back(std::move(*wildcard));
  }
  return out;
}

std::vector<Question> parse_gift(std::string_view text, const ParseOptions & options)
{
  return Parser(options).parse_document(normalize_newlines(text));
}

}  // namespace gift::syntax
