#include "gift/codegen/gift_writer.hpp"

#include <fmt/format.h>

#include <string_view>

#include "gift/syntax/grammar.hpp"
#include "gift/syntax/lexer.hpp"
#include "gift/syntax/scanned_text.hpp"

namespace gift
{

namespace
{

using syntax::escape_literal;

/// Text with a leading [format] tag when it differs from the inherited one.
[[nodiscard]] std::string formatted(const TextWithFormat & text, TextFormat inherited)
{
  std::string out;
  if (!text.text.empty() && text.format != inherited) {
    out += fmt::format("[{}]", to_string(text.format));
  }
  out += escape_literal(text.text);
  return out;
}

/// Fixed notation with trailing zeros dropped; the weight grammar has no exponent.
[[nodiscard]] std::string weight_percent(double fraction)
{
  std::string out = fmt::format("{:.10f}", fraction * 100.0);
  out.erase(out.find_last_not_of('0') + 1);
  if (out.back() == '.') out.pop_back();
  if (out == "-0") out = "0";
  return out;
}

/// Whether the written answer text would itself read back as a %w% prefix.
[[nodiscard]] bool starts_with_weight(const TextWithFormat & text, TextFormat inherited)
{
  return syntax::parse_weight_prefix(syntax::ScannedText::scan(formatted(text, inherited)))
    .has_value();
}

[[nodiscard]] std::string number(double value) { return fmt::format("{}", value); }

/// Header comments hold a single line.
[[nodiscard]] std::string one_line(std::string_view text)
{
  std::string out(text);
  for (auto & c : out) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return out;
}

/// The header is a comment, so '[' is swapped out to keep [id:]/[tag:] out of it.
[[nodiscard]] std::string header_text(std::string_view text)
{
  std::string out = one_line(text);
  for (auto & c : out) {
    if (c == '[') c = '(';
  }
  return out;
}

[[nodiscard]] std::string escape_bracket(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : one_line(text)) {
    if (c == ']') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

[[nodiscard]] std::string metadata_line(const Question & question)
{
  std::string bits;
  const auto add = [&bits](std::string_view key, std::string_view value) {
    if (!bits.empty()) bits.push_back(' ');
    bits += fmt::format("[{}:{}]", key, escape_bracket(value));
  };

  if (!question.idnumber.empty()) {
    add("id", question.idnumber);
  }
  for (const auto & tag : question.tags) {
    add("tag", tag);
  }
  return bits.empty() ? std::string() : "// " + bits + "\n";
}

[[nodiscard]] std::string name_and_text(const Question & question)
{
  return "::" + escape_literal(question.name) + "::" +
         formatted(question.questiontext, TextFormat::Moodle);
}

}  // namespace

// ============================================================================
// Question blocks
// ============================================================================

std::string GiftWriter::write_question(const Question & question) const
{
  std::string out = fmt::format(
    "// question: {}  name: {}\n", header_text(question.id), header_text(question.name));

  const QuestionType type = question.qtype();
  if (type != QuestionType::Category) {
    out += metadata_line(question);
  }

  const TextFormat inherited = question.questiontext.format;

  switch (type) {
    case QuestionType::Category:
      out += "$CATEGORY: " + escape_literal(std::get<CategoryBody>(question.body).category) + "\n";
      break;

    case QuestionType::Description:
      out += name_and_text(question);
      break;

    case QuestionType::Essay:
      out += name_and_text(question);
      out += "{";
      if (!question.generalfeedback.text.empty()) {
        out += "####" + formatted(question.generalfeedback, inherited);
      }
      out += "}\n";
      break;

    case QuestionType::TrueFalse: {
      const auto & body = std::get<TrueFalseBody>(question.body);
      const auto & right_fb = body.correctanswer ? body.feedbacktrue : body.feedbackfalse;
      const auto & wrong_fb = body.correctanswer ? body.feedbackfalse : body.feedbacktrue;
      const std::string right = formatted(right_fb, inherited);
      const std::string wrong = formatted(wrong_fb, inherited);

      out += name_and_text(question);
      out += body.correctanswer ? "{TRUE" : "{FALSE";
      if (!wrong.empty()) {
        out += "#" + wrong;
      } else if (!right.empty()) {
        out += "#";
      }
      if (!right.empty()) {
        out += "#" + right;
      }
      if (!question.generalfeedback.text.empty()) {
        out += "####" + formatted(question.generalfeedback, inherited);
      }
      out += "}\n";
      break;
    }

    case QuestionType::Multichoice:
      write_multichoice(out, question, std::get<MultichoiceBody>(question.body));
      break;

    case QuestionType::Match:
      write_match(out, question, std::get<MatchBody>(question.body));
      break;

    case QuestionType::ShortAnswer:
      write_shortanswer(out, question, std::get<ShortAnswerBody>(question.body));
      break;

    case QuestionType::Numerical:
      write_numerical(out, question, std::get<NumericalBody>(question.body));
      break;
  }

  out += "\n";
  return out;
}

std::string GiftWriter::write_document(const std::vector<Question> & questions) const
{
  std::string out;
  for (size_t i = 0; i < questions.size(); ++i) {
    if (i > 0) out += "\n";
    out += write_question(questions[i]);
  }
  return out;
}

std::string GiftWriter::general_feedback_line(const Question & question) const
{
  if (question.generalfeedback.text.empty()) {
    return {};
  }
  return options_.indent + "####" +
         formatted(question.generalfeedback, question.questiontext.format) + "\n";
}

// ============================================================================
// Multi-line bodies
// ============================================================================

void GiftWriter::write_multichoice(
  std::string & out, const Question & question, const MultichoiceBody & body) const
{
  const TextFormat inherited = question.questiontext.format;

  out += name_and_text(question);
  out += "{\n";
  for (const auto & answer : body.answers) {
    std::string lead;
    if (answer.fraction == 1.0 && body.single) {
      lead = "=";
    } else if (answer.fraction == 0.0) {
      lead = starts_with_weight(answer.answer, inherited) ? "~%0%" : "~";
    } else {
      lead = "~%" + weight_percent(answer.fraction) + "%";
    }

    out += options_.indent + lead + formatted(answer.answer, inherited);
    if (!answer.feedback.text.empty()) {
      out += "#" + formatted(answer.feedback, inherited);
    }
    out += "\n";
  }
  out += general_feedback_line(question);
  out += "}\n";
}

void GiftWriter::write_match(
  std::string & out, const Question & question, const MatchBody & body) const
{
  const TextFormat inherited = question.questiontext.format;

  out += name_and_text(question);
  out += "{\n";
  for (const auto & pair : body.subquestions) {
    out += fmt::format(
      "{}={} -> {}\n", options_.indent, formatted(pair.questiontext, inherited),
      escape_literal(pair.answertext));
  }
  out += general_feedback_line(question);
  out += "}\n";
}

void GiftWriter::write_shortanswer(
  std::string & out, const Question & question, const ShortAnswerBody & body) const
{
  const TextFormat inherited = question.questiontext.format;

  out += name_and_text(question);
  out += "{\n";
  for (const auto & answer : body.answers) {
    out += fmt::format(
      "{}=%{}%{}#{}\n", options_.indent, weight_percent(answer.fraction),
      escape_literal(answer.answer), formatted(answer.feedback, inherited));
  }
  out += general_feedback_line(question);
  out += "}\n";
}

void GiftWriter::write_numerical(
  std::string & out, const Question & question, const NumericalBody & body) const
{
  const TextFormat inherited = question.questiontext.format;

  out += name_and_text(question);
  out += "{#\n";
  for (const auto & answer : body.answers) {
    const std::string feedback = formatted(answer.feedback, inherited);
    if (!answer.is_wildcard()) {
      out += fmt::format(
        "{}=%{}%{}:{}#{}\n", options_.indent, weight_percent(answer.fraction),
        number(*answer.value), number(answer.tolerance), feedback);
    } else if (answer.fraction != 0.0) {
      // A weighted catch-all keeps its weight through a bare '*' value.
      out += fmt::format(
        "{}=%{}%*#{}\n", options_.indent, weight_percent(answer.fraction), feedback);
    } else {
      out += fmt::format("{}~#{}\n", options_.indent, feedback);
    }
  }
  out += general_feedback_line(question);
  out += "}\n";
}

std::string export_gift(const std::vector<Question> & questions, const WriteOptions & options)
{
  return GiftWriter(options).write_document(questions);
}

}  // namespace gift
