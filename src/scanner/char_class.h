#pragma once

#include <cstdint>

namespace sqlscan {

enum class CharClass : uint8_t {
  kWhitespace,    // ' ' '\t' '\n' '\r'
  kDigit,         // 0-9
  kQuote,         // " '
  kPunctuation,   // / - ( ) { } * , . ; + % ?
  kComparator,    // ! < > | = :
  kBracketOpen,   // [
  kBracketClose,  // ]
  kOther,         // starts a bare identifier
};

CharClass ClassifyChar(char c);

bool IsWhitespace(char c);
bool IsDigit(char c);

// True for characters that may appear in a bare identifier.
bool IsIdentifierChar(char c);

// Second character of a two-character operator such as <= <> || =>.
bool IsOperatorSuffix(char c);

}  // namespace sqlscan
