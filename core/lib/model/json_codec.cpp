// gift/model/json_codec.cpp - JSON interchange implementation
//
#include "gift/model/json_codec.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "gift/basic/error.hpp"
#include "gift/syntax/grammar.hpp"

namespace gift
{
namespace
{

using nlohmann::json;

// ============================================================================
// Encoding
// ============================================================================

json j_text(const TextWithFormat & text)
{
  return json{{"text", text.text}, {"format", to_string(text.format)}};
}

json j_body(const DescriptionBody & body)
{
  return json{{"defaultmark", body.defaultmark}, {"length", body.length}};
}

json j_body(const EssayBody & body)
{
  return json{
    {"responseformat", body.responseformat},
    {"responserequired", body.responserequired},
    {"responsefieldlines", body.responsefieldlines},
    {"attachments", body.attachments},
    {"attachmentsrequired", body.attachmentsrequired},
    {"graderinfo", j_text(body.graderinfo)},
    {"responsetemplate", j_text(body.responsetemplate)}};
}

json j_body(const MultichoiceBody & body)
{
  json answers = json::array();
  for (const auto & a : body.answers) {
    answers.push_back(json{
      {"answer", j_text(a.answer)}, {"fraction", a.fraction}, {"feedback", j_text(a.feedback)}});
  }
  return json{
    {"single", body.single}, {"answernumbering", body.answernumbering}, {"answers", answers}};
}

json j_body(const MatchBody & body)
{
  json subquestions = json::array();
  for (const auto & sq : body.subquestions) {
    subquestions.push_back(
      json{{"questiontext", j_text(sq.questiontext)}, {"answertext", sq.answertext}});
  }
  return json{{"subquestions", subquestions}};
}

json j_body(const TrueFalseBody & body)
{
  return json{
    {"correctanswer", body.correctanswer},
    {"feedbacktrue", j_text(body.feedbacktrue)},
    {"feedbackfalse", j_text(body.feedbackfalse)},
    {"penalty", body.penalty}};
}

json j_body(const ShortAnswerBody & body)
{
  json answers = json::array();
  for (const auto & a : body.answers) {
    answers.push_back(
      json{{"answer", a.answer}, {"fraction", a.fraction}, {"feedback", j_text(a.feedback)}});
  }
  return json{{"answers", answers}};
}

json j_body(const NumericalBody & body)
{
  json answers = json::array();
  for (const auto & a : body.answers) {
    json entry;
    if (a.is_wildcard()) {
      entry["answer"] = "*";
    } else {
      entry["answer"] = *a.value;
      entry["tolerance"] = a.tolerance;
    }
    entry["fraction"] = a.fraction;
    entry["feedback"] = j_text(a.feedback);
    answers.push_back(std::move(entry));
  }
  return json{{"answers", answers}};
}

// ============================================================================
// Decoding helpers
// ============================================================================

[[noreturn]] void malformed(const std::string & message)
{
  throw GiftError(ErrorKind::MalformedDocument, message);
}

std::string type_mismatch(std::string_view key, std::string_view expected)
{
  return "field '" + std::string(key) + "' must be " + std::string(expected);
}

const json * field(const json & object, std::string_view key)
{
  const auto it = object.find(std::string(key));
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string get_string(const json & object, std::string_view key, std::string fallback = {})
{
  const json * value = field(object, key);
  if (!value) return fallback;
  if (!value->is_string()) malformed(type_mismatch(key, "a string"));
  return value->get<std::string>();
}

double get_number(const json & object, std::string_view key, double fallback)
{
  const json * value = field(object, key);
  if (!value) return fallback;
  if (!value->is_number()) malformed(type_mismatch(key, "a number"));
  return value->get<double>();
}

int get_int(const json & object, std::string_view key, int fallback)
{
  const json * value = field(object, key);
  if (!value) return fallback;
  if (!value->is_number()) malformed(type_mismatch(key, "a number"));
  const double number = value->get<double>();
  if (
    !std::isfinite(number) || number < std::numeric_limits<int>::min() ||
    number > std::numeric_limits<int>::max()) {
    malformed(type_mismatch(key, "an integer within int range"));
  }
  return static_cast<int>(number);
}

/// A grade fraction; Moodle stores these in [-1, 1].
double get_fraction(const json & object, double fallback)
{
  const double fraction = get_number(object, "fraction", fallback);
  if (fraction < -1.0 || fraction > 1.0) {
    malformed(type_mismatch("fraction", "between -1 and 1"));
  }
  return fraction;
}

/// true/false, or the 0/1 integers older exports use.
bool get_bool(const json & object, std::string_view key, bool fallback)
{
  const json * value = field(object, key);
  if (!value) return fallback;
  if (value->is_boolean()) return value->get<bool>();
  if (value->is_number()) return value->get<double>() != 0.0;
  malformed(type_mismatch(key, "a boolean"));
}

TextFormat decode_format(const json & value, std::string_view key, TextFormat fallback)
{
  if (value.is_null()) return fallback;
  if (!value.is_string()) malformed(type_mismatch(key, "a format name"));
  return parse_text_format(value.get_ref<const std::string &>()).value_or(fallback);
}

/**
 * Read {"text", "format"} or the flat shape: a plain string under `key`
 * with its format under `<key>format`.
 */
TextWithFormat get_text(const json & object, std::string_view key, TextFormat inherited)
{
  TextWithFormat out{"", inherited};
  const json * value = field(object, key);
  if (!value) return out;

  if (value->is_object()) {
    out.text = get_string(*value, "text");
    if (const json * fmt = field(*value, "format")) {
      out.format = decode_format(*fmt, "format", inherited);
    }
    return out;
  }
  if (!value->is_string()) {
    malformed(type_mismatch(key, "a string or a {text, format} object"));
  }

  out.text = value->get<std::string>();
  const std::string format_key = std::string(key) + "format";
  if (const json * fmt = field(object, format_key)) {
    out.format = decode_format(*fmt, format_key, inherited);
  }
  return out;
}

const json & get_array(const json & object, std::string_view key)
{
  static const json k_empty = json::array();
  const json * value = field(object, key);
  if (!value) return k_empty;
  if (!value->is_array()) malformed(type_mismatch(key, "an array"));
  return *value;
}

void require_object(const json & value, std::string_view what)
{
  if (!value.is_object()) {
    malformed(std::string(what) + " must be a JSON object");
  }
}

// ============================================================================
// Decoding
// ============================================================================

EssayBody essay_from_json(const json & object)
{
  EssayBody body;
  body.responseformat = get_string(object, "responseformat", body.responseformat);
  body.responserequired = get_int(object, "responserequired", body.responserequired);
  body.responsefieldlines = get_int(object, "responsefieldlines", body.responsefieldlines);
  body.attachments = get_int(object, "attachments", body.attachments);
  body.attachmentsrequired = get_int(object, "attachmentsrequired", body.attachmentsrequired);
  body.graderinfo = get_text(object, "graderinfo", body.graderinfo.format);
  body.responsetemplate = get_text(object, "responsetemplate", body.responsetemplate.format);
  return body;
}

MultichoiceBody multichoice_from_json(const json & object, TextFormat inherited)
{
  MultichoiceBody body;
  body.single = get_bool(object, "single", body.single);
  body.answernumbering = get_string(object, "answernumbering", body.answernumbering);
  for (const auto & entry : get_array(object, "answers")) {
    require_object(entry, "answer");
    ChoiceAnswer answer;
    answer.answer = get_text(entry, "answer", inherited);
    answer.fraction = get_fraction(entry, 0);
    answer.feedback = get_text(entry, "feedback", inherited);
    body.answers.push_back(std::move(answer));
  }
  return body;
}

MatchBody match_from_json(const json & object, TextFormat inherited)
{
  MatchBody body;
  for (const auto & entry : get_array(object, "subquestions")) {
    require_object(entry, "subquestion");
    MatchPair pair;
    pair.questiontext = get_text(entry, "questiontext", inherited);
    pair.answertext = get_string(entry, "answertext");
    body.subquestions.push_back(std::move(pair));
  }
  return body;
}

TrueFalseBody truefalse_from_json(const json & object, TextFormat inherited)
{
  TrueFalseBody body;
  body.correctanswer = get_bool(object, "correctanswer", false);
  body.feedbacktrue = get_text(object, "feedbacktrue", inherited);
  body.feedbackfalse = get_text(object, "feedbackfalse", inherited);
  body.penalty = get_number(object, "penalty", body.penalty);
  return body;
}

ShortAnswerBody shortanswer_from_json(const json & object, TextFormat inherited)
{
  ShortAnswerBody body;
  for (const auto & entry : get_array(object, "answers")) {
    require_object(entry, "answer");
    ShortAnswer answer;
    const json * value = field(entry, "answer");
    if (value && value->is_number()) {
      answer.answer = value->dump();
    } else {
      answer.answer = get_string(entry, "answer");
    }
    answer.fraction = get_fraction(entry, 1);
    answer.feedback = get_text(entry, "feedback", inherited);
    body.answers.push_back(std::move(answer));
  }
  return body;
}

std::optional<double> numerical_value(const json & entry)
{
  const json * value = field(entry, "answer");
  if (!value) {
    throw GiftError(ErrorKind::MalformedNumeric, "numerical answer is missing");
  }
  if (value->is_number()) {
    const double v = value->get<double>();
    if (!std::isfinite(v)) {
      throw GiftError(ErrorKind::MalformedNumeric, "numerical answer must be finite");
    }
    return v;
  }
  if (!value->is_string()) {
    malformed(type_mismatch("answer", "a number or \"*\""));
  }

  const auto & text = value->get_ref<const std::string &>();
  if (text == "*") {
    return std::nullopt;
  }
  // Moodle itself stores numerical answers as strings.
  if (const auto v = syntax::parse_number(text)) {
    return v;
  }
  throw GiftError(
    ErrorKind::MalformedNumeric, "numerical answer must be a number: '" + text + "'");
}

NumericalBody numerical_from_json(const json & object, TextFormat inherited)
{
  NumericalBody body;
  for (const auto & entry : get_array(object, "answers")) {
    require_object(entry, "answer");
    NumericalAnswer answer;
    answer.value = numerical_value(entry);
    if (answer.value) {
      answer.tolerance = get_number(entry, "tolerance", 0);
      answer.fraction = get_fraction(entry, 1);
    } else {
      answer.fraction = get_fraction(entry, 0);
    }
    answer.feedback = get_text(entry, "feedback", inherited);
    body.answers.push_back(std::move(answer));
  }
  return body;
}

std::string get_id(const json & object)
{
  const json * value = field(object, "id");
  if (!value) return {};
  if (value->is_string()) return value->get<std::string>();
  if (value->is_number()) return value->dump();
  malformed(type_mismatch("id", "a string or a number"));
}

}  // namespace

json question_to_json(const Question & question)
{
  json j;
  j["qtype"] = to_string(question.qtype());
  if (!question.id.empty()) {
    j["id"] = question.id;
  }

  if (const auto * category = question.get_if<CategoryBody>()) {
    j["category"] = category->category;
    return j;
  }

  j["name"] = question.name;
  j["questiontext"] = j_text(question.questiontext);
  j["generalfeedback"] = j_text(question.generalfeedback);
  j["idnumber"] = question.idnumber;
  j["tags"] = question.tags;

  std::visit(
    [&j](const auto & body) {
      using Body = std::decay_t<decltype(body)>;
      if constexpr (!std::is_same_v<Body, CategoryBody>) {
        j.update(j_body(body));
      }
    },
    question.body);
  return j;
}

json questions_to_json(const std::vector<Question> & questions)
{
  json out = json::array();
  for (const auto & q : questions) {
    out.push_back(question_to_json(q));
  }
  return out;
}

Question question_from_json(const json & object)
{
  require_object(object, "question");

  const json * qtype_value = field(object, "qtype");
  const std::string qtype_name =
    (qtype_value && qtype_value->is_string()) ? qtype_value->get<std::string>()
    : qtype_value                             ? qtype_value->dump()
                                              : std::string();
  const auto type = parse_question_type(qtype_name);
  if (!type) {
    throw GiftError(ErrorKind::UnsupportedVariant, "Unsupported qtype in exporter: " + qtype_name);
  }

  Question question;
  question.id = get_id(object);

  if (*type == QuestionType::Category) {
    question.body = CategoryBody{get_string(object, "category")};
    return question;
  }

  question.name = get_string(object, "name");
  question.questiontext = get_text(object, "questiontext", TextFormat::Moodle);
  const TextFormat inherited = question.questiontext.format;
  question.generalfeedback = get_text(object, "generalfeedback", inherited);
  question.idnumber = get_string(object, "idnumber");
  for (const auto & tag : get_array(object, "tags")) {
    if (!tag.is_string()) malformed(type_mismatch("tags", "an array of strings"));
    question.tags.push_back(tag.get<std::string>());
  }

  switch (*type) {
    case QuestionType::Category:
      break;
    case QuestionType::Description: {
      DescriptionBody body;
      body.defaultmark = get_number(object, "defaultmark", body.defaultmark);
      body.length = get_int(object, "length", body.length);
      question.body = body;
      break;
    }
    case QuestionType::Essay:
      question.body = essay_from_json(object);
      break;
    case QuestionType::Multichoice:
      question.body = multichoice_from_json(object, inherited);
      break;
    case QuestionType::Match:
      question.body = match_from_json(object, inherited);
      break;
    case QuestionType::TrueFalse:
      question.body = truefalse_from_json(object, inherited);
      break;
    case QuestionType::ShortAnswer:
      question.body = shortanswer_from_json(object, inherited);
      break;
    case QuestionType::Numerical:
      question.body = numerical_from_json(object, inherited);
      break;
  }
  return question;
}

std::vector<Question> questions_from_json(const json & document)
{
  if (!document.is_array()) {
    malformed("JSON document must be an array of questions");
  }
  std::vector<Question> questions;
  questions.reserve(document.size());
  for (const auto & entry : document) {
    questions.push_back(question_from_json(entry));
  }
  return questions;
}

std::string dump_questions(const std::vector<Question> & questions, int indent)
{
  return questions_to_json(questions).dump(indent, ' ', false, json::error_handler_t::replace);
}

std::vector<Question> load_questions(std::string_view json_text)
{
  json document;
  try {
    document = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    throw GiftError(ErrorKind::MalformedDocument, std::string("invalid JSON: ") + e.what());
  }
  return questions_from_json(document);
}

}  // namespace gift
