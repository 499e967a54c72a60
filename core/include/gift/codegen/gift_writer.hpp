// gift/codegen/gift_writer.hpp - Generate GIFT text from questions
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "gift/model/question.hpp"

namespace gift
{

struct WriteOptions
{
  /// Prefix of the answer lines inside a multi-line {...} body.
  std::string indent = "\t";
};

/**
 * Serializes questions back to GIFT source.
 *
 * The output re-parses to the same field values: every literal is passed
 * through the escaper, weights are written as %fraction*100%, numerical
 * ranges as value:tolerance, and format tags only where a text's format
 * differs from the one it would inherit.
 */
class GiftWriter
{
public:
  explicit GiftWriter(WriteOptions options = {}) : options_(std::move(options)) {}

  /// One question block, including its header comment and trailing blank line.
  [[nodiscard]] std::string write_question(const Question & question) const;

  /// All blocks joined by a newline.
  [[nodiscard]] std::string write_document(const std::vector<Question> & questions) const;

private:
  void write_multichoice(
    std::string & out, const Question & question, const MultichoiceBody & body) const;
  void write_match(std::string & out, const Question & question, const MatchBody & body) const;
  void write_shortanswer(
    std::string & out, const Question & question, const ShortAnswerBody & body) const;
  void write_numerical(
    std::string & out, const Question & question, const NumericalBody & body) const;

  /// "\t####feedback\n", or nothing when the general feedback is empty.
  [[nodiscard]] std::string general_feedback_line(const Question & question) const;

  WriteOptions options_;
};

[[nodiscard]] std::string export_gift(
  const std::vector<Question> & questions, const WriteOptions & options = {});

}  // namespace gift
