#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "common/source_loc.h"

namespace sqlscan {

// Which sub-scanner produced a token. Callers of the cursor API work on the
// token text alone; the kind is kept for tooling and filters.
enum class TokenKind : uint8_t {
  kNumber,                // 12, 1.5, 1.5E10
  kString,                // 'abc', "abc" (quotes kept)
  kBracketedIdentifier,   // [nt:base] (brackets kept)
  kIdentifier,            // SELECT, jcr:title is split at ':'
  kOperator,              // ! < > | = : and two-char forms like <= <> ||
  kPunctuation,           // / - ( ) { } * , . ; + % ? and a stray ]
};

struct Token {
  TokenKind kind = TokenKind::kIdentifier;
  SourceLoc loc;
  uint32_t offset = 0;  // byte offset of the first character in the statement
  std::string text;

  bool Is(TokenKind k) const { return kind == k; }
};

std::string_view TokenKindName(TokenKind kind);

}  // namespace sqlscan
