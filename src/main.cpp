#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "common/diagnostic.h"
#include "common/source_mgr.h"
#include "filter/token_filter.h"
#include "scanner/scanner.h"

namespace {

struct StatementInput {
  std::string name;
  std::string path;  // empty when the statement came from the command line
  std::string text;
};

struct CliOptions {
  std::vector<StatementInput> inputs;
  std::vector<sqlscan::TokenKind> drop_kinds;
  std::vector<std::string> expect_tokens;
  sqlscan::ScannerConfig config;
  bool upper_keywords = false;
  bool quiet = false;
  bool werror = false;
  bool show_version = false;
  bool show_help = false;
};

void PrintVersion() {
  std::cout << "sqlscan 0.1.0\n";
  std::cout << "SQL2 query statement scanner\n";
}

void PrintHelp() {
  PrintVersion();
  std::cout << "\nUsage: sqlscan [options] <statement>...\n\n"
            << "Options:\n"
            << "  -f <file>              Read a statement from a file\n"
            << "  --delimiters <mode>    positional (default) | boundary\n"
            << "  --lenient-brackets     Accept an unclosed [identifier\n"
            << "  --upper-keywords       Upper-case reserved words\n"
            << "  --drop <kind>          Drop number|string|bracketed|\n"
            << "                         identifier|operator|punctuation\n"
            << "  --expect <tokens>      Whitespace separated leading tokens\n"
            << "  --quiet                Do not print diagnostics\n"
            << "  -Werror                Warning controls\n"
            << "  --version / --help     Info\n";
}

std::optional<sqlscan::TokenKind> ParseKindName(std::string_view name) {
  if (name == "number") return sqlscan::TokenKind::kNumber;
  if (name == "string") return sqlscan::TokenKind::kString;
  if (name == "bracketed") return sqlscan::TokenKind::kBracketedIdentifier;
  if (name == "identifier") return sqlscan::TokenKind::kIdentifier;
  if (name == "operator") return sqlscan::TokenKind::kOperator;
  if (name == "punctuation") return sqlscan::TokenKind::kPunctuation;
  return std::nullopt;
}

std::vector<std::string> SplitWords(std::string_view text) {
  std::vector<std::string> words;
  std::istringstream ss{std::string(text)};
  std::string word;
  while (ss >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

bool TryParseValuedArg(std::string_view arg, int& i, int argc,
                       const char* const argv[], CliOptions& opts) {
  if (arg == "-f" && i + 1 < argc) {
    std::string path = argv[++i];
    opts.inputs.push_back({path, path, ""});
    return true;
  }
  if (arg == "--delimiters" && i + 1 < argc) {
    std::string_view mode = argv[++i];
    if (mode == "positional") {
      opts.config.delimiter_mode = sqlscan::DelimiterMode::kPositional;
    } else if (mode == "boundary") {
      opts.config.delimiter_mode = sqlscan::DelimiterMode::kPerBoundary;
    } else {
      std::cerr << "unknown delimiter mode: " << mode << "\n";
      return false;
    }
    return true;
  }
  if (arg == "--drop" && i + 1 < argc) {
    auto kind = ParseKindName(argv[++i]);
    if (!kind) {
      std::cerr << "unknown token kind: " << argv[i] << "\n";
      return false;
    }
    opts.drop_kinds.push_back(*kind);
    return true;
  }
  if (arg == "--expect" && i + 1 < argc) {
    opts.expect_tokens = SplitWords(argv[++i]);
    return true;
  }
  return false;
}

bool TryParseFlag(std::string_view arg, CliOptions& opts) {
  if (arg == "--version") {
    opts.show_version = true;
    return true;
  }
  if (arg == "--help") {
    opts.show_help = true;
    return true;
  }
  if (arg == "--lenient-brackets") {
    opts.config.bracket_policy = sqlscan::BracketPolicy::kLenient;
    return true;
  }
  if (arg == "--upper-keywords") {
    opts.upper_keywords = true;
    return true;
  }
  if (arg == "--quiet") {
    opts.quiet = true;
    return true;
  }
  if (arg == "-Werror") {
    opts.werror = true;
    return true;
  }
  return false;
}

// Options that take the following argument as their value.
bool IsValuedOption(std::string_view arg) {
  return arg == "-f" || arg == "--delimiters" || arg == "--drop" ||
         arg == "--expect";
}

bool ParseArgs(int argc, char* argv[], CliOptions& opts) {
  int statement_index = 0;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (TryParseFlag(arg, opts)) {
      continue;
    }
    if (IsValuedOption(arg)) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for option: " << arg << "\n";
        return false;
      }
      if (!TryParseValuedArg(arg, i, argc, argv, opts)) {
        return false;
      }
      continue;
    }
    if (arg.starts_with("-") && arg.size() > 1) {
      std::cerr << "unknown option: " << arg << "\n";
      return false;
    }
    opts.inputs.push_back(
        {std::format("<arg{}>", ++statement_index), "", std::string(arg)});
  }
  return true;
}

bool ReadFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path);
  if (!ifs) {
    std::cerr << "error: cannot open file '" << path << "'\n";
    return false;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  out = ss.str();
  return true;
}

std::string EscapeWhitespace(std::string_view text) {
  std::string out;
  for (char c : text) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

sqlscan::TokenFilterChain BuildFilterChain(const CliOptions& opts) {
  sqlscan::TokenFilterChain chain;
  if (!opts.drop_kinds.empty()) {
    chain.AddFilter(sqlscan::DropKinds(opts.drop_kinds));
  }
  if (opts.upper_keywords) {
    chain.AddFilter(sqlscan::UpperCaseKeywords());
  }
  return chain;
}

void DumpScan(const sqlscan::Scanner& scanner,
              const sqlscan::TokenFilterChain& chain) {
  for (const auto& tok : chain.Apply(scanner.Tokens())) {
    std::cout << std::format("{}:{}\t{}\t{}\n", tok.loc.line, tok.loc.column,
                             sqlscan::TokenKindName(tok.kind), tok.text);
  }
  std::cout << "delimiters:";
  for (const auto& delim : scanner.Delimiters()) {
    std::cout << " \"" << EscapeWhitespace(delim) << "\"";
  }
  std::cout << "\n";
}

void ScanStatement(const StatementInput& input, const CliOptions& opts,
                   const sqlscan::TokenFilterChain& chain,
                   sqlscan::SourceManager& src_mgr, sqlscan::DiagEngine& diag) {
  auto id = src_mgr.AddSource(input.name, input.text);
  sqlscan::Scanner scanner(src_mgr.SourceContent(id), id, diag, opts.config);
  if (scanner.Failed()) {
    return;
  }
  if (scanner.Tokens().empty()) {
    diag.Warning({id, 1, 1}, "statement contains no tokens");
  }
  if (!opts.expect_tokens.empty()) {
    std::vector<std::string_view> expected(opts.expect_tokens.begin(),
                                           opts.expect_tokens.end());
    if (!scanner.ExpectSequence(expected)) {
      return;
    }
  }
  std::cout << "== " << input.name << ": " << scanner.Statement() << "\n";
  DumpScan(scanner, chain);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!ParseArgs(argc, argv, opts)) {
    return 1;
  }
  if (opts.show_version) {
    PrintVersion();
    return 0;
  }
  if (opts.show_help || opts.inputs.empty()) {
    PrintHelp();
    return opts.show_help ? 0 : 1;
  }

  sqlscan::SourceManager src_mgr;
  sqlscan::DiagEngine diag(src_mgr);
  diag.SetWarningsAsErrors(opts.werror);
  diag.SetQuiet(opts.quiet);

  auto chain = BuildFilterChain(opts);
  for (auto& input : opts.inputs) {
    if (!input.path.empty() && !ReadFile(input.path, input.text)) {
      return 1;
    }
    ScanStatement(input, opts, chain, src_mgr, diag);
  }
  return diag.HasErrors() ? 1 : 0;
}
