#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gift/basic/error.hpp"
#include "gift/syntax/parser.hpp"

using gift::ErrorKind;
using gift::GiftError;
using gift::Question;
using gift::QuestionType;
using gift::TextFormat;
using gift::syntax::parse_gift;

namespace
{

Question parse_one(const std::string & src)
{
  const auto questions = parse_gift(src);
  EXPECT_EQ(questions.size(), 1u) << src;
  if (questions.empty()) {
    return {};
  }
  return questions.front();
}

ErrorKind parse_error_kind(const std::string & src)
{
  try {
    (void)parse_gift(src);
  } catch (const GiftError & e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected a parse error for: " << src;
  return ErrorKind::Io;
}

}  // namespace

// ============================================================================
// Variants
// ============================================================================

TEST(SyntaxParser, NamedShortAnswer)
{
  const Question q = parse_one("::Q1::Capital of France {=Paris}");
  ASSERT_EQ(q.qtype(), QuestionType::ShortAnswer);
  EXPECT_EQ(q.name, "Q1");
  EXPECT_EQ(q.questiontext.text, "Capital of France");
  EXPECT_EQ(q.questiontext.format, TextFormat::Moodle);

  const auto * body = q.get_if<gift::ShortAnswerBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 1u);
  EXPECT_EQ(body->answers[0].answer, "Paris");
  EXPECT_DOUBLE_EQ(body->answers[0].fraction, 1.0);
  EXPECT_TRUE(body->answers[0].feedback.text.empty());
}

TEST(SyntaxParser, ShortAnswerWeightsAndFeedback)
{
  const Question q = parse_one("Colour? {=%50%colour#British =color#American}");
  const auto * body = q.get_if<gift::ShortAnswerBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 2u);
  EXPECT_EQ(body->answers[0].answer, "colour");
  EXPECT_DOUBLE_EQ(body->answers[0].fraction, 0.5);
  EXPECT_EQ(body->answers[0].feedback.text, "British");
  EXPECT_EQ(body->answers[1].answer, "color");
  EXPECT_DOUBLE_EQ(body->answers[1].fraction, 1.0);
}

TEST(SyntaxParser, TrueFalseWithDefaultName)
{
  const Question q = parse_one("Is the sky blue? {T}");
  ASSERT_EQ(q.qtype(), QuestionType::TrueFalse);
  EXPECT_EQ(q.name, "Is the sky blue?");
  const auto * body = q.get_if<gift::TrueFalseBody>();
  ASSERT_NE(body, nullptr);
  EXPECT_TRUE(body->correctanswer);
  EXPECT_DOUBLE_EQ(body->penalty, 1.0);
  EXPECT_TRUE(body->feedbacktrue.text.empty());
  EXPECT_TRUE(body->feedbackfalse.text.empty());
}

TEST(SyntaxParser, TrueFalseFeedbackFollowsVerdict)
{
  {
    const Question q = parse_one("Grass is green {TRUE#Look again#Right}");
    const auto * body = q.get_if<gift::TrueFalseBody>();
    ASSERT_NE(body, nullptr);
    EXPECT_TRUE(body->correctanswer);
    EXPECT_EQ(body->feedbacktrue.text, "Right");
    EXPECT_EQ(body->feedbackfalse.text, "Look again");
  }
  {
    const Question q = parse_one("Sky is green {false#Wrong, it is blue#Correct}");
    const auto * body = q.get_if<gift::TrueFalseBody>();
    ASSERT_NE(body, nullptr);
    EXPECT_FALSE(body->correctanswer);
    EXPECT_EQ(body->feedbacktrue.text, "Wrong, it is blue");
    EXPECT_EQ(body->feedbackfalse.text, "Correct");
  }
}

TEST(SyntaxParser, MultichoiceSingle)
{
  const Question q = parse_one("2+2? {=4 ~3 ~5}");
  ASSERT_EQ(q.qtype(), QuestionType::Multichoice);
  const auto * body = q.get_if<gift::MultichoiceBody>();
  ASSERT_NE(body, nullptr);
  EXPECT_TRUE(body->single);
  ASSERT_EQ(body->answers.size(), 3u);
  EXPECT_EQ(body->answers[0].answer.text, "4");
  EXPECT_DOUBLE_EQ(body->answers[0].fraction, 1.0);
  EXPECT_EQ(body->answers[1].answer.text, "3");
  EXPECT_DOUBLE_EQ(body->answers[1].fraction, 0.0);
  EXPECT_EQ(body->answers[2].answer.text, "5");
  EXPECT_DOUBLE_EQ(body->answers[2].fraction, 0.0);
}

TEST(SyntaxParser, MultichoiceMultipleWeighted)
{
  const Question q =
    parse_one("Pick primes {\n~%50%2#yes\n~%50%3\n~%-100%4#no\n}");
  const auto * body = q.get_if<gift::MultichoiceBody>();
  ASSERT_NE(body, nullptr);
  EXPECT_FALSE(body->single);
  ASSERT_EQ(body->answers.size(), 3u);
  EXPECT_DOUBLE_EQ(body->answers[0].fraction, 0.5);
  EXPECT_EQ(body->answers[0].feedback.text, "yes");
  EXPECT_DOUBLE_EQ(body->answers[1].fraction, 0.5);
  EXPECT_DOUBLE_EQ(body->answers[2].fraction, -1.0);
  EXPECT_EQ(body->answers[2].answer.text, "4");
  EXPECT_EQ(body->answers[2].feedback.text, "no");
}

TEST(SyntaxParser, MultichoiceNeedsTwoAlternatives)
{
  EXPECT_EQ(parse_error_kind("Q {~only}"), ErrorKind::InsufficientAlternatives);
}

TEST(SyntaxParser, MatchPairs)
{
  const Question q = parse_one("Match: {=cat -> animal =rose -> flower}");
  ASSERT_EQ(q.qtype(), QuestionType::Match);
  const auto * body = q.get_if<gift::MatchBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->subquestions.size(), 2u);
  EXPECT_EQ(body->subquestions[0].questiontext.text, "cat");
  EXPECT_EQ(body->subquestions[0].answertext, "animal");
  EXPECT_EQ(body->subquestions[1].questiontext.text, "rose");
  EXPECT_EQ(body->subquestions[1].answertext, "flower");
}

TEST(SyntaxParser, MatchSinglePairIsRejected)
{
  EXPECT_EQ(parse_error_kind("Match {=cat -> animal}"), ErrorKind::InsufficientAlternatives);
}

TEST(SyntaxParser, MatchPairWithoutArrowIsRejected)
{
  EXPECT_EQ(parse_error_kind("Match {=cat -> animal =rose}"), ErrorKind::MissingSeparator);
}

TEST(SyntaxParser, NumericalTolerance)
{
  const Question q = parse_one("Pi? {#3.14159:0.00001}");
  ASSERT_EQ(q.qtype(), QuestionType::Numerical);
  const auto * body = q.get_if<gift::NumericalBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 1u);
  ASSERT_TRUE(body->answers[0].value.has_value());
  EXPECT_DOUBLE_EQ(*body->answers[0].value, 3.14159);
  EXPECT_DOUBLE_EQ(body->answers[0].tolerance, 0.00001);
  EXPECT_DOUBLE_EQ(body->answers[0].fraction, 1.0);
}

TEST(SyntaxParser, NumericalRangeAndBareValue)
{
  const Question q = parse_one("N {#=1..3 =%50%7#close}");
  const auto * body = q.get_if<gift::NumericalBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 2u);
  EXPECT_DOUBLE_EQ(*body->answers[0].value, 2.0);
  EXPECT_DOUBLE_EQ(body->answers[0].tolerance, 1.0);
  EXPECT_DOUBLE_EQ(*body->answers[1].value, 7.0);
  EXPECT_DOUBLE_EQ(body->answers[1].tolerance, 0.0);
  EXPECT_DOUBLE_EQ(body->answers[1].fraction, 0.5);
  EXPECT_EQ(body->answers[1].feedback.text, "close");
}

TEST(SyntaxParser, NumericalWildcardIsAppendedLast)
{
  const Question q = parse_one("N {#=5#ok ~#Wrong}");
  const auto * body = q.get_if<gift::NumericalBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 2u);
  EXPECT_DOUBLE_EQ(*body->answers[0].value, 5.0);
  EXPECT_EQ(body->answers[0].feedback.text, "ok");
  EXPECT_TRUE(body->answers[1].is_wildcard());
  EXPECT_DOUBLE_EQ(body->answers[1].fraction, 0.0);
  EXPECT_EQ(body->answers[1].feedback.text, "Wrong");
}

TEST(SyntaxParser, NumericalErrors)
{
  EXPECT_EQ(parse_error_kind("N {#abc}"), ErrorKind::MalformedNumeric);
  EXPECT_EQ(parse_error_kind("N {#1..}"), ErrorKind::MalformedNumeric);
  EXPECT_EQ(parse_error_kind("N {#}"), ErrorKind::InsufficientAlternatives);
}

TEST(SyntaxParser, Essay)
{
  const Question q = parse_one("Write about your summer. {}");
  ASSERT_EQ(q.qtype(), QuestionType::Essay);
  const auto * body = q.get_if<gift::EssayBody>();
  ASSERT_NE(body, nullptr);
  EXPECT_EQ(body->responseformat, "editor");
  EXPECT_EQ(body->responsefieldlines, 15);
  EXPECT_EQ(body->graderinfo.format, TextFormat::Html);
}

TEST(SyntaxParser, EssayWithGeneralFeedback)
{
  const Question q = parse_one("Essay {####Mention at least two places}");
  ASSERT_EQ(q.qtype(), QuestionType::Essay);
  EXPECT_EQ(q.generalfeedback.text, "Mention at least two places");
}

TEST(SyntaxParser, Description)
{
  const Question q = parse_one("::Intro::The next questions are about maps.");
  ASSERT_EQ(q.qtype(), QuestionType::Description);
  EXPECT_EQ(q.name, "Intro");
  EXPECT_EQ(q.questiontext.text, "The next questions are about maps.");
}

TEST(SyntaxParser, Category)
{
  const auto questions = parse_gift("$CATEGORY: $course$/Geography\n\nQ {T}");
  ASSERT_EQ(questions.size(), 2u);
  ASSERT_EQ(questions[0].qtype(), QuestionType::Category);
  EXPECT_EQ(questions[0].get_if<gift::CategoryBody>()->category, "$course$/Geography");
  EXPECT_TRUE(questions[0].name.empty());
  EXPECT_EQ(questions[1].qtype(), QuestionType::TrueFalse);
}

// ============================================================================
// Shared structure
// ============================================================================

TEST(SyntaxParser, InlineBlank)
{
  const Question q = parse_one("The capital of France is {=Paris} and it is nice.");
  EXPECT_EQ(q.questiontext.text, "The capital of France is _____ and it is nice.");
}

TEST(SyntaxParser, GeneralFeedbackUsesLastMarker)
{
  const Question q = parse_one("Q {=a ~b ####Well done}");
  ASSERT_EQ(q.qtype(), QuestionType::Multichoice);
  EXPECT_EQ(q.generalfeedback.text, "Well done");
  EXPECT_EQ(q.get_if<gift::MultichoiceBody>()->answers.size(), 2u);
}

TEST(SyntaxParser, FormatTagsAreInherited)
{
  const Question q = parse_one("[html]<p>Pick <b>one</b></p> {=a ~[plain]b}");
  EXPECT_EQ(q.questiontext.format, TextFormat::Html);
  EXPECT_EQ(q.questiontext.text, "<p>Pick <b>one</b></p>");
  EXPECT_EQ(q.name, "Pick one");
  EXPECT_EQ(q.generalfeedback.format, TextFormat::Html);

  const auto * body = q.get_if<gift::MultichoiceBody>();
  ASSERT_NE(body, nullptr);
  EXPECT_EQ(body->answers[0].answer.format, TextFormat::Html);
  EXPECT_EQ(body->answers[1].answer.format, TextFormat::Plain);
  EXPECT_EQ(body->answers[1].answer.text, "b");
}

TEST(SyntaxParser, EscapedCharactersAreLiteral)
{
  const Question q = parse_one("::a\\:b::Is 1\\=1? {=yes ~no \\~ maybe}");
  EXPECT_EQ(q.name, "a:b");
  EXPECT_EQ(q.questiontext.text, "Is 1=1?");
  const auto * body = q.get_if<gift::MultichoiceBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 2u);
  EXPECT_EQ(body->answers[1].answer.text, "no ~ maybe");
}

TEST(SyntaxParser, EscapedBracesMakeDescription)
{
  const Question q = parse_one("Use \\{braces\\} freely\\nplease");
  ASSERT_EQ(q.qtype(), QuestionType::Description);
  EXPECT_EQ(q.questiontext.text, "Use {braces} freely\nplease");
}

TEST(SyntaxParser, MetadataFromComments)
{
  const Question q = parse_one("// [id:Q\\]7] [tag:geo] [tag:easy]\n::Q::Capital? {=Paris}");
  EXPECT_EQ(q.idnumber, "Q]7");
  ASSERT_EQ(q.tags.size(), 2u);
  EXPECT_EQ(q.tags[0], "geo");
  EXPECT_EQ(q.tags[1], "easy");
}

TEST(SyntaxParser, DefaultNameIsTruncated)
{
  const Question q = parse_one("The quick brown fox jumps over the lazy dog {T}");
  EXPECT_EQ(q.name, "The quick brown fox jumps over");
}

TEST(SyntaxParser, NameOptions)
{
  gift::syntax::ParseOptions options;
  options.name_length = 5;
  options.fallback_name = "Untitled";

  const auto named = parse_gift("Capital of France {=Paris}", options);
  ASSERT_EQ(named.size(), 1u);
  EXPECT_EQ(named[0].name, "Capit");

  const auto unnamed = parse_gift("{=Paris}", options);
  ASSERT_EQ(unnamed.size(), 1u);
  EXPECT_EQ(unnamed[0].name, "Untitled");
}

TEST(SyntaxParser, CrlfAndCommentOnlyBlocks)
{
  const auto questions =
    parse_gift("// header comment\r\n\r\nQ1 {T}\r\n\r\n// between\r\n\r\nQ2 {F}\r\n");
  ASSERT_EQ(questions.size(), 2u);
  EXPECT_EQ(questions[0].questiontext.text, "Q1");
  EXPECT_EQ(questions[1].questiontext.text, "Q2");
}

TEST(SyntaxParser, MultiLineQuestion)
{
  const auto questions = parse_gift(
    "// question: 1\n"
    "::Rivers::Which river\n"
    "flows through Paris? {\n"
    "  =Seine#Right\n"
    "  ~Thames#London\n"
    "  ~Danube\n"
    "}\n");
  ASSERT_EQ(questions.size(), 1u);
  const Question & q = questions[0];
  EXPECT_EQ(q.name, "Rivers");
  EXPECT_EQ(q.questiontext.text, "Which river\nflows through Paris?");
  const auto * body = q.get_if<gift::MultichoiceBody>();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->answers.size(), 3u);
  EXPECT_EQ(body->answers[1].feedback.text, "London");
}

// ============================================================================
// Errors
// ============================================================================

TEST(SyntaxParser, BraceMismatch)
{
  EXPECT_EQ(parse_error_kind("Q {"), ErrorKind::BraceMismatch);
  EXPECT_EQ(parse_error_kind("Q }"), ErrorKind::BraceMismatch);
  EXPECT_EQ(parse_error_kind("Q } and {"), ErrorKind::BraceMismatch);
}

TEST(SyntaxParser, BraceMismatchMessageAndRange)
{
  try {
    (void)parse_gift("Q1 {T}\n\nBad {\n");
    FAIL() << "expected BraceMismatch";
  } catch (const GiftError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::BraceMismatch);
    EXPECT_EQ(std::string(e.what()), "brace error in question: Bad {");
    EXPECT_EQ(e.range().get_begin().get_offset(), 8u);
    EXPECT_EQ(e.range().get_end().get_offset(), 13u);
  }
}

TEST(SyntaxParser, OneBadBlockFailsTheWholeDocument)
{
  EXPECT_THROW((void)parse_gift("Good {T}\n\nBad {~only}\n\nAlso good {F}"), GiftError);
}

TEST(SyntaxParser, ParseBlockSkipsCommentOnlyBlocks)
{
  gift::syntax::RawBlock block;
  block.body = " \n ";
  block.comments = " note\n note\n";
  const gift::syntax::Parser parser;
  EXPECT_FALSE(parser.parse_block(block).has_value());
}
