#include "scanner/char_class.h"

namespace sqlscan {

CharClass ClassifyChar(char c) {
  switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
      return CharClass::kWhitespace;
    case '"':
    case '\'':
      return CharClass::kQuote;
    case '/':
    case '-':
    case '(':
    case ')':
    case '{':
    case '}':
    case '*':
    case ',':
    case '.':
    case ';':
    case '+':
    case '%':
    case '?':
      return CharClass::kPunctuation;
    case '!':
    case '<':
    case '>':
    case '|':
    case '=':
    case ':':
      return CharClass::kComparator;
    case '[':
      return CharClass::kBracketOpen;
    case ']':
      return CharClass::kBracketClose;
    default:
      break;
  }
  if (IsDigit(c)) return CharClass::kDigit;
  return CharClass::kOther;
}

bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsIdentifierChar(char c) {
  // Digits and quotes are allowed once an identifier has started: a1, it's.
  switch (ClassifyChar(c)) {
    case CharClass::kWhitespace:
    case CharClass::kPunctuation:
    case CharClass::kComparator:
    case CharClass::kBracketOpen:
    case CharClass::kBracketClose:
      return false;
    default:
      return true;
  }
}

bool IsOperatorSuffix(char c) { return c == '=' || c == '|' || c == '>'; }

}  // namespace sqlscan
