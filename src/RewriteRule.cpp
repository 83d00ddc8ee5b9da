#include "pgconv/RewriteRule.h"

#include "rewrite/RewriteHelpers.h"

#include <stdexcept>
#include <utility>

namespace pgconv {
namespace {
// Latin-1 so that every byte of a dump is one character, whatever its
// encoding.
std::shared_ptr<const re2::RE2> compileExpression(const std::string &expression, bool ignoreCase) {
  re2::RE2::Options options;
  options.set_encoding(re2::RE2::Options::EncodingLatin1);
  options.set_case_sensitive(!ignoreCase);
  options.set_log_errors(false);
  auto compiled = std::make_shared<const re2::RE2>(expression, options);
  if (!compiled->ok()) {
    throw std::invalid_argument("invalid rewrite expression " + expression + ": " + compiled->error());
  }
  return compiled;
}

std::string expandTemplate(const RewritePattern &pattern, const RewriteMatch &match) {
  std::string replaced;
  if (!pattern.expression->Rewrite(&replaced,
                                   pattern.replacement,
                                   match.groups.data(),
                                   static_cast<int>(match.groups.size()))) {
    return match.str(0);
  }
  return replaced;
}
} // namespace

RewritePattern makeTemplatePattern(const std::string &expression, const std::string &replacement, bool ignoreCase) {
  RewritePattern pattern;
  pattern.expression = compileExpression(expression, ignoreCase);
  pattern.kind = ReplacementKind::Template;
  pattern.replacement = replacement;
  std::string error;
  if (!pattern.expression->CheckRewriteString(replacement, &error)) {
    throw std::invalid_argument("invalid rewrite template " + replacement + ": " + error);
  }
  return pattern;
}

RewritePattern makeComputedPattern(const std::string &expression, MatchReplacer replacer, bool ignoreCase) {
  RewritePattern pattern;
  pattern.expression = compileExpression(expression, ignoreCase);
  pattern.kind = ReplacementKind::Computed;
  pattern.replacer = std::move(replacer);
  return pattern;
}

RewritePattern protectQuotedIdentifiers(RewritePattern pattern) {
  pattern.skipQuotedIdentifiers = true;
  return pattern;
}

std::string replaceMatches(const std::string &input, const re2::RE2 &expression, const MatchReplacer &replacer) {
  std::string output;
  output.reserve(input.size());
  const re2::StringPiece text(input);
  RewriteMatch match;
  match.groups.resize(static_cast<size_t>(expression.NumberOfCapturingGroups()) + 1);
  size_t pos = 0;
  size_t copied = 0;
  while (pos <= input.size() &&
         expression.Match(text,
                          pos,
                          input.size(),
                          re2::RE2::UNANCHORED,
                          match.groups.data(),
                          static_cast<int>(match.groups.size()))) {
    const size_t start = static_cast<size_t>(match.groups[0].data() - input.data());
    const size_t end = start + match.groups[0].size();
    match.offset = start;
    output.append(input, copied, start - copied);
    output += replacer(match);
    copied = end;
    pos = end;
    if (end == start) {
      // Step over one character so an empty match cannot repeat.
      if (end < input.size()) {
        output += input[end];
      }
      copied = end + 1;
      pos = end + 1;
    }
  }
  if (copied < input.size()) {
    output.append(input, copied, std::string::npos);
  }
  return output;
}

std::string applyPattern(const RewritePattern &pattern, const std::string &input) {
  scan::QuotedIdentifierScanner scanner(input);
  return replaceMatches(input, *pattern.expression, [&](const RewriteMatch &match) {
    if (pattern.skipQuotedIdentifiers && scanner.insideAt(match.offset)) {
      return match.str(0);
    }
    if (pattern.kind == ReplacementKind::Computed) {
      return pattern.replacer(match);
    }
    return expandTemplate(pattern, match);
  });
}

std::string RewriteRule::apply(const std::string &input) const {
  std::string text = input;
  for (const auto &pattern : patterns) {
    text = applyPattern(pattern, text);
  }
  return text;
}

} // namespace pgconv
