#pragma once

#include <string_view>
#include <vector>

#include "pgconv/RewriteRule.h"

namespace pgconv {

// Immutable, ordered list of rewrite rules. Position 1 runs first.
class RuleTable {
public:
  explicit RuleTable(std::vector<RewriteRule> rules);

  const std::vector<RewriteRule> &rules() const {
    return rules_;
  }
  size_t size() const {
    return rules_.size();
  }

  // Accepts a rule name or its 1-based position.
  const RewriteRule *find(std::string_view nameOrPosition) const;

private:
  std::vector<RewriteRule> rules_;
};

std::vector<RewriteRule> makeMySqlToPostgresRules();
RuleTable makeMySqlToPostgresRuleTable();

} // namespace pgconv
