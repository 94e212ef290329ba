#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include "scanner/token.h"

namespace sqlscan {

// One step of a filter chain: returns the token, possibly rewritten, or
// std::nullopt to drop it.
using TokenFilter = std::function<std::optional<Token>(Token)>;

class TokenFilterChain {
 public:
  void AddFilter(TokenFilter filter);

  // Runs every step in order; the first drop ends the chain.
  std::optional<Token> Filter(Token token) const;
  // Lets a chain be added to another chain as a single step.
  std::optional<Token> operator()(Token token) const {
    return Filter(std::move(token));
  }
  std::vector<Token> Apply(const std::vector<Token>& tokens) const;

  size_t Size() const { return filters_.size(); }
  bool Empty() const { return filters_.empty(); }

 private:
  std::vector<TokenFilter> filters_;
};

// Drops tokens of any of the given kinds.
TokenFilter DropKinds(std::initializer_list<TokenKind> kinds);
TokenFilter DropKinds(std::vector<TokenKind> kinds);

// Rewrites identifier tokens that are reserved words to upper case.
TokenFilter UpperCaseKeywords();

}  // namespace sqlscan
