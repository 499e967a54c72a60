// tests/unit/driver/test_converter.cpp - Unit tests for the conversion driver
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "gift/driver/converter.hpp"

using namespace gift;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / name)
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

const Diagnostic & only_diagnostic(const ConvertResult & result)
{
  EXPECT_EQ(result.diagnostics.size(), 1u);
  return result.diagnostics.all().front();
}

}  // namespace

// ============================================================================
// Parse (GIFT -> JSON)
// ============================================================================

TEST(DriverConverter, ParseTextProducesJson)
{
  GiftConfig config;
  config.json.indent = -1;
  const auto result = Converter::parse_text("Is the sky blue? {T}", config);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.question_count, 1u);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_NE(result.output.find(R"("qtype":"truefalse")"), std::string::npos);
  EXPECT_NE(result.output.find(R"("correctanswer":true)"), std::string::npos);
  EXPECT_EQ(result.output.find('\n'), std::string::npos);
}

TEST(DriverConverter, ParseUsesNameConfig)
{
  GiftConfig config;
  config.json.indent = -1;
  config.parse.name_length = 3;
  const auto result = Converter::parse_text("Capital? {=Paris}", config);
  ASSERT_TRUE(result.success);
  EXPECT_NE(result.output.find(R"("name":"Cap")"), std::string::npos);
}

TEST(DriverConverter, BraceErrorBecomesDiagnostic)
{
  const auto result = Converter::parse_text("Q1 {T}\r\n\r\nBad {\r\n", GiftConfig{}, "quiz.gift");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.output.empty());
  EXPECT_EQ(result.source.content(), "Q1 {T}\n\nBad {\n");

  const Diagnostic & diag = only_diagnostic(result);
  EXPECT_EQ(diag.code, "E0001");
  EXPECT_EQ(diag.message, "brace error in question: Bad {");
  ASSERT_TRUE(diag.help.has_value());
  EXPECT_FALSE(diag.label.empty());
  EXPECT_EQ(diag.range.get_begin().get_offset(), 8u);
}

TEST(DriverConverter, ParseErrorCodes)
{
  EXPECT_EQ(
    only_diagnostic(Converter::parse_text("Q {~only}", GiftConfig{})).code, "E0002");
  EXPECT_EQ(only_diagnostic(Converter::parse_text("N {#abc}", GiftConfig{})).code, "E0003");
  EXPECT_EQ(
    only_diagnostic(Converter::parse_text("M {=a -> b =c}", GiftConfig{})).code, "E0004");
}

// ============================================================================
// Export (JSON -> GIFT)
// ============================================================================

TEST(DriverConverter, ExportTextProducesGift)
{
  GiftConfig config;
  config.export_.indent = "  ";
  const auto result = Converter::export_text(
    R"([{"qtype":"multichoice","name":"M","questiontext":{"text":"Pick"},"single":true,
        "answers":[{"answer":{"text":"a"},"fraction":1},{"answer":{"text":"b"},"fraction":0}]}])",
    config);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.question_count, 1u);
  EXPECT_EQ(result.output, "// question:   name: M\n::M::Pick{\n  =a\n  ~b\n}\n\n");
}

TEST(DriverConverter, ExportErrorCodes)
{
  const auto unsupported = Converter::export_text(R"([{"qtype":"cloze"}])", GiftConfig{});
  EXPECT_FALSE(unsupported.success);
  const Diagnostic & diag = only_diagnostic(unsupported);
  EXPECT_EQ(diag.code, "E0005");
  EXPECT_FALSE(diag.range.is_valid());

  EXPECT_EQ(only_diagnostic(Converter::export_text("not json", GiftConfig{})).code, "E0006");
  EXPECT_EQ(only_diagnostic(Converter::export_text("{}", GiftConfig{})).code, "E0006");
}

// ============================================================================
// Files
// ============================================================================

TEST(DriverConverter, ConvertFileRoundTrip)
{
  const TempDir dir("giftc_converter_files");
  const auto gift_path = dir.path / "quiz.gift";
  const auto json_path = dir.path / "quiz.json";
  const auto back_path = dir.path / "back.gift";
  Converter::write_file(gift_path, "::Q1::2+2? {=4 ~3 ~5}\n\nSky? {T}\n");

  ConvertOptions to_json;
  to_json.mode = ConvertMode::Parse;
  to_json.output_path = json_path;
  const auto parsed = Converter::convert_file(gift_path, to_json);
  ASSERT_TRUE(parsed.success);
  EXPECT_EQ(parsed.question_count, 2u);
  EXPECT_EQ(Converter::read_file(json_path), parsed.output);

  ConvertOptions to_gift;
  to_gift.mode = ConvertMode::Export;
  to_gift.output_path = back_path;
  const auto exported = Converter::convert_file(json_path, to_gift);
  ASSERT_TRUE(exported.success);
  EXPECT_EQ(exported.question_count, 2u);

  const auto reparsed = Converter::parse_text(Converter::read_file(back_path), GiftConfig{});
  ASSERT_TRUE(reparsed.success);
  EXPECT_EQ(reparsed.output, parsed.output);
}

TEST(DriverConverter, MissingInputIsIoError)
{
  const TempDir dir("giftc_converter_missing");
  ConvertOptions options;
  const auto result = Converter::convert_file(dir.path / "absent.gift", options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(only_diagnostic(result).code, "E0007");
}

TEST(DriverConverter, UnwritableOutputIsIoError)
{
  const TempDir dir("giftc_converter_unwritable");
  const auto input = dir.path / "quiz.gift";
  Converter::write_file(input, "Q {T}");

  ConvertOptions options;
  options.output_path = dir.path / "no_such_dir" / "out.json";
  const auto result = Converter::convert_file(input, options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(only_diagnostic(result).code, "E0007");
}

TEST(DriverConverter, WriteFileThrowsIo)
{
  const TempDir dir("giftc_converter_write");
  try {
    Converter::write_file(dir.path / "missing" / "x.gift", "x");
    FAIL() << "expected GiftError";
  } catch (const GiftError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::Io);
  }
}
