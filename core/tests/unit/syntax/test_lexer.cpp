#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "gift/syntax/lexer.hpp"
#include "gift/syntax/scanned_text.hpp"
#include "gift/syntax/token.hpp"

using gift::syntax::escape_literal;
using gift::syntax::Lexer;
using gift::syntax::ScannedText;
using gift::syntax::spell;
using gift::syntax::tokenize_literal;
using gift::syntax::TokenKind;

TEST(SyntaxLexer, SplitsTextAndEscapes)
{
  Lexer lex("a\\:b");
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, TokenKind::Text);
  EXPECT_EQ(toks[0].text, "a");
  EXPECT_EQ(toks[1].kind, TokenKind::Escape);
  EXPECT_EQ(toks[1].value, ':');
  EXPECT_EQ(toks[1].text, "\\:");
  EXPECT_EQ(toks[1].range.get_begin().get_offset(), 1u);
  EXPECT_EQ(toks[1].range.get_end().get_offset(), 3u);
  EXPECT_EQ(toks[2].kind, TokenKind::Text);
  EXPECT_EQ(toks[2].text, "b");
  EXPECT_EQ(toks[3].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, BackslashNStandsForNewline)
{
  Lexer lex("line\\nnext");
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[1].kind, TokenKind::Escape);
  EXPECT_EQ(toks[1].value, '\n');
}

TEST(SyntaxLexer, LoneBackslashIsText)
{
  Lexer lex("C\\d and \\");
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 2u);
  EXPECT_EQ(toks[0].kind, TokenKind::Text);
  EXPECT_EQ(toks[0].text, "C\\d and \\");
  EXPECT_EQ(toks[1].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, EmptyInputYieldsOnlyEof)
{
  Lexer lex("");
  const auto toks = lex.lex_all();
  ASSERT_EQ(toks.size(), 1u);
  EXPECT_EQ(toks[0].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, EscapeLiteralEscapesReservedCharacters)
{
  EXPECT_EQ(escape_literal("a:b#c=d{e}f~g"), "a\\:b\\#c\\=d\\{e\\}f\\~g");
  EXPECT_EQ(escape_literal("x\ny"), "x\\ny");
  EXPECT_EQ(escape_literal("back\\slash"), "back\\\\slash");
  EXPECT_EQ(escape_literal("plain text"), "plain text");
}

TEST(SyntaxLexer, EscapeLiteralDropsCarriageReturns)
{
  EXPECT_EQ(escape_literal("a\r\nb"), "a\\nb");
}

TEST(SyntaxLexer, TokenizeLiteralSpellsBack)
{
  const auto toks = tokenize_literal("1=1");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[1].kind, TokenKind::Escape);
  EXPECT_EQ(spell(toks), "1\\=1");
}

TEST(SyntaxLexer, EscapeThenScanRestoresEveryReservedCharacter)
{
  const std::vector<std::string> samples = {
    ":", "#", "=", "{", "}", "~", "\n", "\\", "a::b", "{=x~y#z}", "C:\\new\\path"};

  for (const auto & literal : samples) {
    const ScannedText scanned = ScannedText::scan(escape_literal(literal));
    EXPECT_EQ(scanned.str(), literal) << "literal: " << literal;
    for (size_t i = 0; i < scanned.size(); ++i) {
      if (gift::syntax::is_reserved(scanned.at(i))) {
        EXPECT_TRUE(scanned.is_escaped(i)) << "literal: " << literal << " index " << i;
      }
    }
  }
}
