#include "scanner/scanner.h"

#include "scanner/char_class.h"

namespace sqlscan {

Scanner::Scanner(std::string_view statement, uint32_t file_id,
                 DiagEngine& diag, ScannerConfig config)
    : statement_(statement), file_id_(file_id), diag_(diag), config_(config) {
  if (!ScanAll()) {
    failed_ = true;
    end_loc_ = MakeLoc();
    tokens_.clear();
    delimiters_.clear();
    gaps_.clear();
  }
}

char Scanner::Current() const {
  if (AtEndOfInput()) {
    return '\0';
  }
  return statement_[pos_];
}

char Scanner::PeekChar() const {
  if (pos_ + 1 >= statement_.size()) {
    return '\0';
  }
  return statement_[pos_ + 1];
}

void Scanner::Advance() {
  if (AtEndOfInput()) {
    return;
  }
  if (statement_[pos_] == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  ++pos_;
}

bool Scanner::AtEndOfInput() const { return pos_ >= statement_.size(); }

SourceLoc Scanner::MakeLoc() const { return {file_id_, line_, column_}; }

// ---------------------------------------------------------------------------
// Top-level dispatch
// ---------------------------------------------------------------------------

bool Scanner::ScanAll() {
  while (!AtEndOfInput()) {
    SkipWhitespace();
    if (AtEndOfInput()) {
      break;
    }
    switch (ClassifyChar(Current())) {
      case CharClass::kDigit:
        ScanNumber();
        break;
      case CharClass::kQuote:
        if (!ScanQuotedString()) return false;
        break;
      case CharClass::kPunctuation:
      case CharClass::kBracketClose:
        ScanPunctuation();
        break;
      case CharClass::kComparator:
        ScanOperator();
        break;
      case CharClass::kBracketOpen:
        if (!ScanBracketedIdentifier()) return false;
        break;
      case CharClass::kOther:
        ScanIdentifier();
        break;
      case CharClass::kWhitespace:
        break;
    }
  }
  gaps_.push_back(std::move(pending_gap_));
  pending_gap_.clear();
  end_loc_ = MakeLoc();
  return true;
}

void Scanner::SkipWhitespace() {
  uint32_t start = pos_;
  while (!AtEndOfInput() && IsWhitespace(Current())) {
    Advance();
  }
  if (pos_ == start) {
    return;
  }
  auto run = statement_.substr(start, pos_ - start);
  pending_gap_ += run;
  delimiters_.push_back(std::move(run));
}

void Scanner::EmitToken(TokenKind kind, SourceLoc loc, uint32_t start,
                        std::string text) {
  gaps_.push_back(std::move(pending_gap_));
  pending_gap_.clear();
  Token tok;
  tok.kind = kind;
  tok.loc = loc;
  tok.offset = start;
  tok.text = std::move(text);
  tokens_.push_back(std::move(tok));
}

// ---------------------------------------------------------------------------
// Operators and punctuation
// ---------------------------------------------------------------------------

void Scanner::ScanPunctuation() {
  auto loc = MakeLoc();
  uint32_t start = pos_;
  Advance();
  EmitToken(TokenKind::kPunctuation, loc, start,
            statement_.substr(start, 1));
}

void Scanner::ScanOperator() {
  auto loc = MakeLoc();
  uint32_t start = pos_;
  // Any comparator followed by = | > forms one token (<=, <>, ||, =>, :=,
  // even =| ). Whether the pair means anything is for the parser to decide.
  if (pos_ + 1 < statement_.size() && IsOperatorSuffix(PeekChar())) {
    Advance();
  }
  Advance();
  EmitToken(TokenKind::kOperator, loc, start,
            statement_.substr(start, pos_ - start));
}

}  // namespace sqlscan
