#include "scanner/token.h"

namespace sqlscan {

std::string_view TokenKindName(TokenKind kind) {
  switch (kind) {
    case TokenKind::kNumber:
      return "number";
    case TokenKind::kString:
      return "string";
    case TokenKind::kBracketedIdentifier:
      return "bracketed identifier";
    case TokenKind::kIdentifier:
      return "identifier";
    case TokenKind::kOperator:
      return "operator";
    case TokenKind::kPunctuation:
      return "punctuation";
  }
  return "token";
}

}  // namespace sqlscan
