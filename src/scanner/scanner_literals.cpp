#include <format>

#include "scanner/char_class.h"
#include "scanner/scanner.h"

namespace sqlscan {

// ---------------------------------------------------------------------------
// Numbers
// ---------------------------------------------------------------------------

void Scanner::ScanNumber() {
  auto loc = MakeLoc();
  uint32_t start = pos_;
  while (!AtEndOfInput() && IsDigit(Current())) {
    Advance();
  }
  // Fractional part. A '.' that ends the statement is left for the driver;
  // any other '.' is taken, even with no digits after it ("1.e5").
  if (pos_ + 1 < statement_.size() && Current() == '.') {
    Advance();
    while (!AtEndOfInput() && IsDigit(Current())) {
      Advance();
    }
  }
  // Exponent. No sign: in 1E-5 the '-' is a separate token.
  if (Current() == 'E' || Current() == 'e') {
    Advance();
    while (!AtEndOfInput() && IsDigit(Current())) {
      Advance();
    }
  }
  EmitToken(TokenKind::kNumber, loc, start,
            statement_.substr(start, pos_ - start));
}

// ---------------------------------------------------------------------------
// Quoted strings
// ---------------------------------------------------------------------------

bool Scanner::ScanQuotedString() {
  auto loc = MakeLoc();
  uint32_t start = pos_;
  char quote = Current();
  std::string text(1, quote);
  Advance();  // skip opening quote

  while (!AtEndOfInput()) {
    char c = Current();
    Advance();
    if (c == quote) {
      text.push_back(c);
      EmitToken(TokenKind::kString, loc, start, std::move(text));
      return true;
    }
    // Only \<quote> is an escape; the backslash is dropped.
    if (c == '\\' && !AtEndOfInput() && Current() == quote) {
      text.push_back(quote);
      Advance();
      continue;
    }
    text.push_back(c);
  }

  diag_.Error(loc, std::format("unterminated quoted string '{}' in '{}'", text,
                               statement_));
  return false;
}

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

bool Scanner::ScanBracketedIdentifier() {
  auto loc = MakeLoc();
  uint32_t start = pos_;
  Advance();  // skip [
  int level = 1;
  while (!AtEndOfInput()) {
    char c = Current();
    Advance();
    if (c == ']' && --level == 0) {
      EmitToken(TokenKind::kBracketedIdentifier, loc, start,
                statement_.substr(start, pos_ - start));
      return true;
    }
    if (c == '[') {
      ++level;
    }
  }

  if (config_.bracket_policy == BracketPolicy::kLenient) {
    return true;
  }
  diag_.Error(loc, std::format("unterminated bracketed identifier '{}' in '{}'",
                               statement_.substr(start), statement_));
  return false;
}

void Scanner::ScanIdentifier() {
  auto loc = MakeLoc();
  uint32_t start = pos_;
  while (!AtEndOfInput() && IsIdentifierChar(Current())) {
    Advance();
  }
  EmitToken(TokenKind::kIdentifier, loc, start,
            statement_.substr(start, pos_ - start));
}

}  // namespace sqlscan
