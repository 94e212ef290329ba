#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "common/diagnostic.h"
#include "common/source_mgr.h"
#include "scanner/scanner.h"

using namespace sqlscan;

namespace {

struct ScannerTest : ::testing::Test {
 protected:
  ScannerTest() { diag_.SetQuiet(true); }

  Scanner& Scan(const std::string& src, ScannerConfig config = {}) {
    auto fid = mgr_.AddSource("<test>", src);
    scanner_ =
        std::make_unique<Scanner>(mgr_.SourceContent(fid), fid, diag_, config);
    return *scanner_;
  }

  std::vector<std::string> Texts(const std::string& src,
                                 ScannerConfig config = {}) {
    std::vector<std::string> out;
    for (const auto& tok : Scan(src, config).Tokens()) {
      out.push_back(tok.text);
    }
    return out;
  }

  std::string LastMessage() const {
    if (diag_.Diagnostics().empty()) return "";
    return diag_.Diagnostics().back().message;
  }

  SourceManager mgr_;
  DiagEngine diag_{mgr_};
  std::unique_ptr<Scanner> scanner_;
};

using TextList = std::vector<std::string>;

// --- Driver ---

TEST_F(ScannerTest, EmptyInput) {
  auto& s = Scan("");
  EXPECT_FALSE(s.Failed());
  EXPECT_TRUE(s.Tokens().empty());
  EXPECT_TRUE(s.Delimiters().empty());
  ASSERT_EQ(s.Gaps().size(), 1u);
  EXPECT_EQ(s.Gaps()[0], "");
}

TEST_F(ScannerTest, OnlyWhitespace) {
  auto& s = Scan(" \t\r\n ");
  EXPECT_TRUE(s.Tokens().empty());
  ASSERT_EQ(s.Delimiters().size(), 1u);
  EXPECT_EQ(s.Delimiters()[0], " \t\r\n ");
}

TEST_F(ScannerTest, SelectFromBracketedNodeType) {
  auto& s = Scan("SELECT * FROM [nt:base]");
  ASSERT_EQ(s.Tokens().size(), 4u);
  EXPECT_EQ(s.Tokens()[0].text, "SELECT");
  EXPECT_EQ(s.Tokens()[1].text, "*");
  EXPECT_EQ(s.Tokens()[2].text, "FROM");
  EXPECT_EQ(s.Tokens()[3].text, "[nt:base]");
  EXPECT_EQ(s.Tokens()[0].kind, TokenKind::kIdentifier);
  EXPECT_EQ(s.Tokens()[1].kind, TokenKind::kPunctuation);
  EXPECT_EQ(s.Tokens()[3].kind, TokenKind::kBracketedIdentifier);
  EXPECT_EQ(s.Delimiters(), TextList({" ", " ", " "}));
}

TEST_F(ScannerTest, WhitespaceRunsRecordedVerbatim) {
  EXPECT_EQ(Texts("  a \t\n b  "), TextList({"a", "b"}));
  EXPECT_EQ(scanner_->Delimiters(), TextList({"  ", " \t\n ", "  "}));
}

TEST_F(ScannerTest, AdjacentTokensRecordNoDelimiter) {
  auto& s = Scan("f(a,b);");
  EXPECT_EQ(s.Tokens().size(), 7u);
  EXPECT_TRUE(s.Delimiters().empty());
}

TEST_F(ScannerTest, GapsAreKeyedByTokenIndex) {
  auto& s = Scan("\ta(b) c\n");
  ASSERT_EQ(s.Tokens().size(), 5u);
  EXPECT_EQ(s.Gaps(), TextList({"\t", "", "", "", " ", "\n"}));
  EXPECT_EQ(s.Delimiters(), TextList({"\t", " ", "\n"}));
}

TEST_F(ScannerTest, GapsReconstructStatement) {
  const std::string src =
      "SELECT a.[jcr:title] , b.*\nFROM [nt:base] AS a\tINNER JOIN [nt:file]"
      " AS b ON ISCHILDNODE(b,a)  WHERE a.p<>'x y' AND b.n>=1.5E3  ";
  auto& s = Scan(src);
  ASSERT_FALSE(s.Failed());
  std::string rebuilt = s.Gaps()[0];
  for (size_t i = 0; i < s.Tokens().size(); ++i) {
    rebuilt += s.Tokens()[i].text;
    rebuilt += s.Gaps()[i + 1];
  }
  EXPECT_EQ(rebuilt, src);
}

TEST_F(ScannerTest, TokenLocationsAndOffsets) {
  auto& s = Scan("SELECT\n  *  FROM t");
  ASSERT_EQ(s.Tokens().size(), 4u);
  EXPECT_EQ(s.Tokens()[0].loc.line, 1u);
  EXPECT_EQ(s.Tokens()[0].loc.column, 1u);
  EXPECT_EQ(s.Tokens()[1].loc.line, 2u);
  EXPECT_EQ(s.Tokens()[1].loc.column, 3u);
  EXPECT_EQ(s.Tokens()[1].offset, 9u);
  EXPECT_EQ(s.Tokens()[2].offset, 12u);
}

// --- Operators and punctuation ---

TEST_F(ScannerTest, TwoCharOperatorWithoutWhitespace) {
  EXPECT_EQ(Texts("a<=b"), TextList({"a", "<=", "b"}));
  EXPECT_EQ(Scan("a<=b").Tokens()[1].kind, TokenKind::kOperator);
}

TEST_F(ScannerTest, TwoCharOperators) {
  EXPECT_EQ(Texts("a<>b"), TextList({"a", "<>", "b"}));
  EXPECT_EQ(Texts("a!=b"), TextList({"a", "!=", "b"}));
  EXPECT_EQ(Texts("a>=b"), TextList({"a", ">=", "b"}));
  EXPECT_EQ(Texts("a||b"), TextList({"a", "||", "b"}));
  EXPECT_EQ(Texts("a:=b"), TextList({"a", ":=", "b"}));
  EXPECT_EQ(Texts("a=>b"), TextList({"a", "=>", "b"}));
}

TEST_F(ScannerTest, OperatorPairsAreNotValidated) {
  EXPECT_EQ(Texts("a=|b"), TextList({"a", "=|", "b"}));
  EXPECT_EQ(Texts("a:>b"), TextList({"a", ":>", "b"}));
}

TEST_F(ScannerTest, SingleCharOperators) {
  EXPECT_EQ(Texts("a =<b"), TextList({"a", "=", "<", "b"}));
  EXPECT_EQ(Texts("a<"), TextList({"a", "<"}));
  EXPECT_EQ(Texts("!a"), TextList({"!", "a"}));
}

TEST_F(ScannerTest, ColonSplitsBareIdentifier) {
  EXPECT_EQ(Texts("jcr:title"), TextList({"jcr", ":", "title"}));
}

TEST_F(ScannerTest, Punctuation) {
  EXPECT_EQ(Texts("/-(){}*,.;+%?"),
            TextList({"/", "-", "(", ")", "{", "}", "*", ",", ".", ";", "+",
                   "%", "?"}));
}

TEST_F(ScannerTest, StrayClosingBracketIsPunctuation) {
  auto& s = Scan("a]b");
  ASSERT_EQ(s.Tokens().size(), 3u);
  EXPECT_EQ(s.Tokens()[1].text, "]");
  EXPECT_EQ(s.Tokens()[1].kind, TokenKind::kPunctuation);
}

// --- Numbers ---

TEST_F(ScannerTest, NumberWithFractionAndExponent) {
  auto& s = Scan("1.5E10");
  ASSERT_EQ(s.Tokens().size(), 1u);
  EXPECT_EQ(s.Tokens()[0].text, "1.5E10");
  EXPECT_EQ(s.Tokens()[0].kind, TokenKind::kNumber);
}

TEST_F(ScannerTest, NumberForms) {
  EXPECT_EQ(Texts("42"), TextList({"42"}));
  EXPECT_EQ(Texts("0.25e3"), TextList({"0.25e3"}));
  EXPECT_EQ(Texts("3e"), TextList({"3e"}));
  EXPECT_EQ(Texts("7E3.5"), TextList({"7E3", ".", "5"}));
}

TEST_F(ScannerTest, NumberTrailingDotAtEndIsSeparate) {
  EXPECT_EQ(Texts("1."), TextList({"1", "."}));
}

TEST_F(ScannerTest, NumberDotWithoutDigitsIsConsumed) {
  EXPECT_EQ(Texts("1.a"), TextList({"1.", "a"}));
  EXPECT_EQ(Texts("1. "), TextList({"1."}));
}

TEST_F(ScannerTest, NumberExponentSignIsSeparateToken) {
  EXPECT_EQ(Texts("1E-5"), TextList({"1E", "-", "5"}));
  EXPECT_EQ(Texts("2e+3"), TextList({"2e", "+", "3"}));
}

TEST_F(ScannerTest, NumberStopsAtLetter) {
  EXPECT_EQ(Texts("12abc"), TextList({"12", "abc"}));
}

// --- Quoted strings ---

TEST_F(ScannerTest, SingleQuotedString) {
  auto& s = Scan("'hello'");
  ASSERT_EQ(s.Tokens().size(), 1u);
  EXPECT_EQ(s.Tokens()[0].text, "'hello'");
  EXPECT_EQ(s.Tokens()[0].kind, TokenKind::kString);
}

TEST_F(ScannerTest, StringKeepsInnerWhitespaceAndOperators) {
  EXPECT_EQ(Texts("x = \"a <= [b]\""), TextList({"x", "=", "\"a <= [b]\""}));
}

TEST_F(ScannerTest, StringEscapedQuoteDropsBackslash) {
  EXPECT_EQ(Texts("'it\\'s'"), TextList({"'it's'"}));
  EXPECT_EQ(Texts("\"say \\\"hi\\\"\""), TextList({"\"say \"hi\"\""}));
}

TEST_F(ScannerTest, StringOtherBackslashesAreLiteral) {
  EXPECT_EQ(Texts("'a\\b'"), TextList({"'a\\b'"}));
  EXPECT_EQ(Texts("\"it\\'s\""), TextList({"\"it\\'s\""}));
}

TEST_F(ScannerTest, StringOtherQuoteKindDoesNotClose) {
  EXPECT_EQ(Texts("\"it's\" x"), TextList({"\"it's\"", "x"}));
}

TEST_F(ScannerTest, UnterminatedStringFailsConstruction) {
  auto& s = Scan("'unterminated");
  EXPECT_TRUE(s.Failed());
  EXPECT_TRUE(diag_.HasErrors());
  EXPECT_TRUE(s.Tokens().empty());
  EXPECT_TRUE(s.Delimiters().empty());
  EXPECT_EQ(LastMessage(),
            "unterminated quoted string ''unterminated' in ''unterminated'");
}

TEST_F(ScannerTest, UnterminatedStringDiscardsEarlierTokens) {
  auto& s = Scan("SELECT * FROM t WHERE a = 'x");
  EXPECT_TRUE(s.Failed());
  EXPECT_TRUE(s.Tokens().empty());
  ASSERT_EQ(diag_.Diagnostics().size(), 1u);
  EXPECT_EQ(diag_.Diagnostics()[0].loc.column, 27u);
  EXPECT_NE(LastMessage().find("SELECT * FROM t WHERE a = 'x"),
            std::string::npos);
}

TEST_F(ScannerTest, EscapedClosingQuoteLeavesStringOpen) {
  auto& s = Scan("'abc\\'");
  EXPECT_TRUE(s.Failed());
  EXPECT_EQ(LastMessage(), "unterminated quoted string ''abc'' in ''abc\\''");
}

// --- Bracketed identifiers ---

TEST_F(ScannerTest, BracketedIdentifierWithSpaces) {
  EXPECT_EQ(Texts("[my node] x"), TextList({"[my node]", "x"}));
}

TEST_F(ScannerTest, BracketedIdentifierNests) {
  EXPECT_EQ(Texts("[a[b]c]"), TextList({"[a[b]c]"}));
  EXPECT_EQ(Texts("[a]]"), TextList({"[a]", "]"}));
}

TEST_F(ScannerTest, UnterminatedBracketIsErrorByDefault) {
  auto& s = Scan("SELECT [abc");
  EXPECT_TRUE(s.Failed());
  EXPECT_TRUE(s.Tokens().empty());
  EXPECT_EQ(LastMessage(),
            "unterminated bracketed identifier '[abc' in 'SELECT [abc'");
}

TEST_F(ScannerTest, UnterminatedNestedBracketIsError) {
  EXPECT_TRUE(Scan("[a[b]").Failed());
}

TEST_F(ScannerTest, UnterminatedBracketLenientStopsSilently) {
  ScannerConfig config;
  config.bracket_policy = BracketPolicy::kLenient;
  auto& s = Scan("SELECT [abc", config);
  EXPECT_FALSE(s.Failed());
  EXPECT_FALSE(diag_.HasErrors());
  EXPECT_EQ(Texts("SELECT [abc", config), TextList({"SELECT"}));
}

// --- Bare identifiers ---

TEST_F(ScannerTest, BareIdentifierAllowsDigitsAndQuotes) {
  EXPECT_EQ(Texts("a1 it's"), TextList({"a1", "it's"}));
}

TEST_F(ScannerTest, BareIdentifierStopsAtBracket) {
  EXPECT_EQ(Texts("a[b]"), TextList({"a", "[b]"}));
}

TEST_F(ScannerTest, BareIdentifierKeepsOtherSymbols) {
  EXPECT_EQ(Texts("a@b#c$ &"), TextList({"a@b#c$", "&"}));
}

}  // namespace
