#pragma once

#include <optional>
#include <string_view>

namespace sqlscan {

// Canonical (upper-case) spelling of a JCR-SQL2 reserved word, matched
// case-insensitively. Bracketed and quoted tokens never match.
std::optional<std::string_view> LookupKeyword(std::string_view text);

}  // namespace sqlscan
