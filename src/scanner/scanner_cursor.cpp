#include <cctype>
#include <format>

#include "scanner/scanner.h"

namespace sqlscan {
namespace {

constexpr std::string_view kTrimChars(" \t\n\r\0\x0B", 6);

std::string_view Trim(std::string_view text) {
  auto first = text.find_first_not_of(kTrimChars);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(kTrimChars);
  return text.substr(first, last - first + 1);
}

}  // namespace

std::string_view Scanner::Lookahead(size_t offset) const {
  // position_ never exceeds tokens_.size().
  if (offset < tokens_.size() - position_) {
    return Trim(tokens_[position_ + offset].text);
  }
  return {};
}

std::string_view Scanner::Consume() {
  auto token = Lookahead();
  if (!token.empty()) {
    ++position_;
  }
  return token;
}

std::string_view Scanner::PreviousDelimiter() const {
  if (position_ == 0) {
    return " ";
  }
  if (config_.delimiter_mode == DelimiterMode::kPerBoundary) {
    return position_ < gaps_.size() ? std::string_view(gaps_[position_]) : " ";
  }
  if (position_ - 1 < delimiters_.size()) {
    return delimiters_[position_ - 1];
  }
  return " ";
}

bool Scanner::Expect(std::string_view token, bool case_insensitive) {
  auto loc = position_ < tokens_.size() ? tokens_[position_].loc : end_loc_;
  auto found = Consume();
  if (TokensEqual(found, token, case_insensitive)) {
    return true;
  }
  diag_.Error(loc, std::format("expected '{}', found '{}' in '{}'", token,
                               found, statement_));
  return false;
}

bool Scanner::ExpectSequence(const std::vector<std::string_view>& tokens,
                             bool case_insensitive) {
  for (auto token : tokens) {
    if (!Expect(token, case_insensitive)) {
      return false;
    }
  }
  return true;
}

bool Scanner::TokensEqual(std::string_view a, std::string_view b,
                          bool case_insensitive) {
  if (!case_insensitive) {
    return a == b;
  }
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace sqlscan
