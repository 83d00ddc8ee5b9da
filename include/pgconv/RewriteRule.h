#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

namespace pgconv {

// Capture groups of one match. groups[0] is the whole match; a group that did
// not take part in the match has a null data pointer.
struct RewriteMatch {
  std::vector<re2::StringPiece> groups;
  size_t offset = 0;

  bool matched(size_t index) const {
    return index < groups.size() && groups[index].data() != nullptr;
  }
  std::string str(size_t index) const {
    if (!matched(index)) {
      return {};
    }
    return std::string(groups[index].data(), groups[index].size());
  }
};

using MatchReplacer = std::function<std::string(const RewriteMatch &)>;

enum class ReplacementKind { Template, Computed };

// One regular expression and what to put in place of each match. Template
// replacements use RE2 rewrite references (\1, \2, ...).
struct RewritePattern {
  std::shared_ptr<const re2::RE2> expression;
  ReplacementKind kind = ReplacementKind::Template;
  std::string replacement;
  MatchReplacer replacer;
  bool skipQuotedIdentifiers = false;
};

struct RewriteRule {
  std::string name;
  std::string summary;
  std::vector<RewritePattern> patterns;

  std::string apply(const std::string &input) const;
};

// Both factories throw std::invalid_argument when the expression or the
// template does not compile.
RewritePattern makeTemplatePattern(const std::string &expression,
                                   const std::string &replacement,
                                   bool ignoreCase = true);
RewritePattern makeComputedPattern(const std::string &expression, MatchReplacer replacer, bool ignoreCase = true);
RewritePattern protectQuotedIdentifiers(RewritePattern pattern);

std::string applyPattern(const RewritePattern &pattern, const std::string &input);
std::string replaceMatches(const std::string &input, const re2::RE2 &expression, const MatchReplacer &replacer);

} // namespace pgconv
