#include "scanner/keywords.h"

#include <cctype>
#include <string>
#include <unordered_set>

namespace sqlscan {

static const std::unordered_set<std::string_view>& KeywordSet() {
  static const std::unordered_set<std::string_view> set = {
      // Query structure
      "SELECT",
      "FROM",
      "WHERE",
      "AS",
      "ORDER",
      "BY",
      "ASC",
      "DESC",
      "UNION",
      "ALL",
      // Joins
      "JOIN",
      "INNER",
      "LEFT",
      "RIGHT",
      "OUTER",
      "ON",
      "ISSAMENODE",
      "ISCHILDNODE",
      "ISDESCENDANTNODE",
      // Constraints
      "AND",
      "OR",
      "NOT",
      "LIKE",
      "IS",
      "NULL",
      "CONTAINS",
      // Operands
      "LENGTH",
      "NAME",
      "LOCALNAME",
      "SCORE",
      "LOWER",
      "UPPER",
      "CAST",
      // Literal types for CAST(... AS <type>)
      "STRING",
      "BINARY",
      "DATE",
      "LONG",
      "DOUBLE",
      "DECIMAL",
      "BOOLEAN",
      "PATH",
      "REFERENCE",
      "WEAKREFERENCE",
      "URI",
  };
  return set;
}

std::optional<std::string_view> LookupKeyword(std::string_view text) {
  // Longest entry is ISDESCENDANTNODE.
  if (text.empty() || text.size() > 16) {
    return std::nullopt;
  }
  std::string upper(text);
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  auto it = KeywordSet().find(upper);
  if (it == KeywordSet().end()) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace sqlscan
