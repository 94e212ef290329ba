#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/diagnostic.h"
#include "common/source_loc.h"
#include "scanner/token.h"

namespace sqlscan {

enum class DelimiterMode : uint8_t {
  // PreviousDelimiter() indexes the whitespace list by cursor position. The
  // list only grows where whitespace was present, so lookups drift after two
  // adjacent tokens. Kept for parsers that depend on that behavior.
  kPositional,
  // PreviousDelimiter() returns the exact gap between the last consumed token
  // and the next one, empty when they touch.
  kPerBoundary,
};

enum class BracketPolicy : uint8_t {
  kStrict,   // an unclosed [ is reported like an unclosed quote
  kLenient,  // an unclosed [ ends the scan without a token or a diagnostic
};

struct ScannerConfig {
  DelimiterMode delimiter_mode = DelimiterMode::kPositional;
  BracketPolicy bracket_policy = BracketPolicy::kStrict;
};

// Scanning session over one statement. The constructor tokenizes the whole
// statement; afterwards only the cursor position changes. On a malformed
// literal an error is reported through `diag`, Failed() turns true and the
// token and delimiter lists stay empty.
class Scanner {
 public:
  Scanner(std::string_view statement, uint32_t file_id, DiagEngine& diag,
          ScannerConfig config = {});

  // --- Cursor (scanner_cursor.cpp) ---

  // Trimmed text of the token `offset` places ahead of the cursor, or an
  // empty view past the end.
  std::string_view Lookahead(size_t offset = 0) const;
  std::string_view Consume();
  std::string_view PreviousDelimiter() const;

  // Consumes the next token and reports a syntax error if it differs from
  // `token`. Returns false on mismatch.
  bool Expect(std::string_view token, bool case_insensitive = true);
  // Expect() for each element, stopping at the first mismatch.
  bool ExpectSequence(const std::vector<std::string_view>& tokens,
                      bool case_insensitive = true);

  static bool TokensEqual(std::string_view a, std::string_view b,
                          bool case_insensitive = true);

  size_t Position() const { return position_; }
  bool AtEnd() const { return position_ >= tokens_.size(); }
  bool Failed() const { return failed_; }

  const std::string& Statement() const { return statement_; }
  const std::vector<Token>& Tokens() const { return tokens_; }
  // Whitespace runs in source order, one entry per nonempty run.
  const std::vector<std::string>& Delimiters() const { return delimiters_; }
  // gaps_[i] is the whitespace before token i; the last entry is the
  // trailing whitespace. Always Tokens().size() + 1 entries after a scan.
  const std::vector<std::string>& Gaps() const { return gaps_; }

 private:
  char Current() const;
  char PeekChar() const;
  void Advance();
  bool AtEndOfInput() const;
  SourceLoc MakeLoc() const;

  // Driver (scanner.cpp)
  bool ScanAll();
  void SkipWhitespace();
  void EmitToken(TokenKind kind, SourceLoc loc, uint32_t start,
                 std::string text);
  void ScanPunctuation();
  void ScanOperator();

  // Sub-scanners (scanner_literals.cpp)
  void ScanNumber();
  bool ScanQuotedString();
  bool ScanBracketedIdentifier();
  void ScanIdentifier();

  std::string statement_;
  uint32_t file_id_;
  DiagEngine& diag_;
  ScannerConfig config_;

  // Scan state, only used during construction.
  uint32_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
  std::string pending_gap_;

  std::vector<Token> tokens_;
  std::vector<std::string> delimiters_;
  std::vector<std::string> gaps_;
  SourceLoc end_loc_;
  bool failed_ = false;

  size_t position_ = 0;
};

}  // namespace sqlscan
