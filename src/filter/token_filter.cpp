#include "filter/token_filter.h"

#include <algorithm>

#include "scanner/keywords.h"

namespace sqlscan {

void TokenFilterChain::AddFilter(TokenFilter filter) {
  filters_.push_back(std::move(filter));
}

std::optional<Token> TokenFilterChain::Filter(Token token) const {
  std::optional<Token> current(std::move(token));
  for (const auto& filter : filters_) {
    current = filter(std::move(*current));
    if (!current) {
      return std::nullopt;
    }
  }
  return current;
}

std::vector<Token> TokenFilterChain::Apply(
    const std::vector<Token>& tokens) const {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (const auto& tok : tokens) {
    if (auto kept = Filter(tok)) {
      out.push_back(std::move(*kept));
    }
  }
  return out;
}

TokenFilter DropKinds(std::initializer_list<TokenKind> kinds) {
  return DropKinds(std::vector<TokenKind>(kinds));
}

TokenFilter DropKinds(std::vector<TokenKind> kinds) {
  return [kinds = std::move(kinds)](Token tok) -> std::optional<Token> {
    if (std::find(kinds.begin(), kinds.end(), tok.kind) != kinds.end()) {
      return std::nullopt;
    }
    return tok;
  };
}

TokenFilter UpperCaseKeywords() {
  return [](Token tok) -> std::optional<Token> {
    if (!tok.Is(TokenKind::kIdentifier)) return tok;
    if (auto kw = LookupKeyword(tok.text)) {
      tok.text = std::string(*kw);
    }
    return tok;
  };
}

}  // namespace sqlscan
