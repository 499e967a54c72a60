// gift/driver/converter.cpp - Conversion driver implementation
//
#include "gift/driver/converter.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <vector>

#include "gift/codegen/gift_writer.hpp"
#include "gift/model/json_codec.hpp"
#include "gift/syntax/parser.hpp"

namespace gift
{

namespace
{

std::string label_for(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::BraceMismatch:
      return "unbalanced braces in this question";
    case ErrorKind::InsufficientAlternatives:
      return "too few answers in this question";
    case ErrorKind::MalformedNumeric:
      return "invalid numerical answer in this question";
    case ErrorKind::MissingSeparator:
      return "matching pair without '->' in this question";
    default:
      return "";
  }
}

std::optional<std::string> help_for(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::BraceMismatch:
      return "escape literal braces as \\{ and \\}";
    case ErrorKind::InsufficientAlternatives:
      return "multiple choice and matching questions need at least two entries";
    case ErrorKind::MalformedNumeric:
      return "numerical answers are written as value, value:tolerance or min..max";
    case ErrorKind::MissingSeparator:
      return "write each pair as =question -> answer";
    case ErrorKind::UnsupportedVariant:
      return "qtype must be one of category, description, essay, multichoice, match, "
             "truefalse, shortanswer, numerical";
    default:
      return std::nullopt;
  }
}

syntax::ParseOptions parse_options(const GiftConfig & config)
{
  syntax::ParseOptions options;
  options.name_length = config.parse.name_length;
  options.fallback_name = config.parse.fallback_name;
  return options;
}

}  // namespace

ConvertResult Converter::parse_text(
  std::string_view gift_text, const GiftConfig & config, const std::filesystem::path & name)
{
  ConvertResult result;
  result.source = SourceFile(name, syntax::normalize_newlines(gift_text));

  try {
    const syntax::Parser parser(parse_options(config));
    const std::vector<Question> questions = parser.parse_document(result.source.content());
    result.output = dump_questions(questions, config.json.indent);
    result.question_count = questions.size();
  } catch (const GiftError & e) {
    report(result.diagnostics, e);
    result.output.clear();
  } catch (const nlohmann::json::exception & e) {
    result.diagnostics.report_error(
      std::string(error_code(ErrorKind::MalformedDocument)),
      std::string("JSON encoding failed: ") + e.what());
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

ConvertResult Converter::export_text(
  std::string_view json_text, const GiftConfig & config, const std::filesystem::path & name)
{
  ConvertResult result;
  result.source = SourceFile(name, std::string(json_text));

  try {
    const std::vector<Question> questions = load_questions(json_text);
    WriteOptions options;
    options.indent = config.export_.indent;
    result.output = export_gift(questions, options);
    result.question_count = questions.size();
  } catch (const GiftError & e) {
    report(result.diagnostics, e);
    result.output.clear();
  } catch (const nlohmann::json::exception & e) {
    result.diagnostics.report_error(
      std::string(error_code(ErrorKind::MalformedDocument)), e.what());
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

ConvertResult Converter::convert_file(
  const std::filesystem::path & input, const ConvertOptions & options)
{
  std::string content;
  try {
    content = read_file(input);
  } catch (const GiftError & e) {
    ConvertResult result;
    report(result.diagnostics, e);
    return result;
  }

  ConvertResult result = options.mode == ConvertMode::Parse
                           ? parse_text(content, options.config, input)
                           : export_text(content, options.config, input);

  if (result.success && options.output_path) {
    try {
      write_file(*options.output_path, result.output);
    } catch (const GiftError & e) {
      report(result.diagnostics, e);
      result.success = false;
    }
  }
  return result;
}

std::string Converter::read_file(const std::filesystem::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw GiftError(ErrorKind::Io, "failed to open file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw GiftError(ErrorKind::Io, "failed to read file: " + path.string());
  }
  return buffer.str();
}

void Converter::write_file(const std::filesystem::path & path, std::string_view content)
{
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    throw GiftError(ErrorKind::Io, "failed to open output file: " + path.string());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    throw GiftError(ErrorKind::Io, "failed to write output file: " + path.string());
  }
}

void Converter::report(DiagnosticBag & diags, const GiftError & error)
{
  Diagnostic & diag =
    diags.report_error(std::string(error_code(error.kind())), error.what(), error.range());
  diag.label = label_for(error.kind());
  diag.help = help_for(error.kind());
}

}  // namespace gift
