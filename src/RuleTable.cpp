#include "pgconv/RuleTable.h"

#include "rewrite/RewriteHelpers.h"

#include <cctype>
#include <string>
#include <utility>

namespace pgconv {
namespace {
bool parsePosition(std::string_view text, size_t &out) {
  if (text.empty() || text.size() > 4) {
    return false;
  }
  size_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<size_t>(c - '0');
  }
  out = value;
  return true;
}

RewriteRule makeRule(std::string name, std::string summary, std::vector<RewritePattern> patterns) {
  RewriteRule rule;
  rule.name = std::move(name);
  rule.summary = std::move(summary);
  rule.patterns = std::move(patterns);
  return rule;
}

// The column name is taken from the text between the leading word and
// UNSIGNED, so "age INTEGER UNSIGNED" yields INTEGER as the name.
std::string rewriteUnsigned(const RewriteMatch &match) {
  const std::string columnType = scan::trimWhitespace(match.str(1));
  const std::string columnName = scan::trimWhitespace(match.str(2));
  return columnType + " " + columnName + " CHECK (" + columnName + " >= 0)";
}

std::string rewriteGroupConcat(const RewriteMatch &match) {
  std::string separator = match.matched(2) ? match.str(2) : ",";
  return "STRING_AGG(" + match.str(1) + ", '" + separator + "')";
}
} // namespace

RuleTable::RuleTable(std::vector<RewriteRule> rules) : rules_(std::move(rules)) {}

const RewriteRule *RuleTable::find(std::string_view nameOrPosition) const {
  size_t position = 0;
  if (parsePosition(nameOrPosition, position)) {
    if (position == 0 || position > rules_.size()) {
      return nullptr;
    }
    return &rules_[position - 1];
  }
  for (const auto &rule : rules_) {
    if (rule.name == nameOrPosition) {
      return &rule;
    }
  }
  return nullptr;
}

std::vector<RewriteRule> makeMySqlToPostgresRules() {
  std::vector<RewriteRule> rules;
  rules.reserve(16);

  rules.push_back(makeRule("quote-identifiers",
                           "`name` -> \"name\"",
                           {makeTemplatePattern(R"(`(.*?)`)", R"("\1")", false)}));

  rules.push_back(makeRule("auto-increment",
                           "AUTO_INCREMENT -> SERIAL",
                           {protectQuotedIdentifiers(makeTemplatePattern(R"(AUTO_?INCREMENT)", "SERIAL"))}));

  // INT(n) goes first so the precision is dropped instead of leaving INTEGER(n).
  rules.push_back(makeRule("integer-type",
                           "INT, INT(n) -> INTEGER",
                           {protectQuotedIdentifiers(makeTemplatePattern(R"(\bINT\(\d+\))", "INTEGER")),
                            protectQuotedIdentifiers(makeTemplatePattern(R"(\bINT\b)", "INTEGER"))}));

  rules.push_back(makeRule("text-types",
                           "TINYTEXT, MEDIUMTEXT, LONGTEXT -> TEXT",
                           {protectQuotedIdentifiers(makeTemplatePattern(R"(\b(TINY|MEDIUM|LONG)TEXT\b)", "TEXT"))}));

  rules.push_back(makeRule("unsigned-check",
                           "<type> <name> UNSIGNED -> <type> <name> CHECK (<name> >= 0)",
                           {makeComputedPattern(R"((\w+\s+)(.*?)(\s+UNSIGNED\b))", rewriteUnsigned)}));

  rules.push_back(makeRule("boolean-type",
                           "TINYINT(1) -> BOOLEAN",
                           {protectQuotedIdentifiers(makeTemplatePattern(R"(\bTINYINT\(1\))", "BOOLEAN"))}));

  rules.push_back(makeRule("datetime-type",
                           "DATETIME -> TIMESTAMP",
                           {protectQuotedIdentifiers(makeTemplatePattern(R"(\bDATETIME\b)", "TIMESTAMP"))}));

  rules.push_back(makeRule("ifnull",
                           "IFNULL(a, b) -> COALESCE(a, b)",
                           {makeTemplatePattern(R"(IFNULL\((.*?),(.*?)\))", R"(COALESCE(\1,\2))")}));

  rules.push_back(makeRule("limit-offset",
                           "LIMIT offset, count -> LIMIT count OFFSET offset",
                           {makeTemplatePattern(R"(LIMIT\s+(\d+)\s*,\s*(\d+))", R"(LIMIT \2 OFFSET \1)")}));

  rules.push_back(makeRule("now",
                           "NOW() -> CURRENT_TIMESTAMP",
                           {makeTemplatePattern(R"(\bNOW\(\))", "CURRENT_TIMESTAMP")}));

  rules.push_back(makeRule("substring-index",
                           "SUBSTRING_INDEX(str, delim, n) -> split_part(str, delim, n)",
                           {makeTemplatePattern(R"(SUBSTRING_INDEX\(([^,]+),\s*([^,]+),\s*(\d+)\))",
                                                R"(split_part(\1, \2, \3))")}));

  rules.push_back(makeRule("group-concat",
                           "GROUP_CONCAT(expr SEPARATOR 'sep') -> STRING_AGG(expr, 'sep')",
                           {makeComputedPattern(R"(GROUP_CONCAT\(([^)]+?)(?:\s+SEPARATOR\s+'([^']*)')?\))",
                                                rewriteGroupConcat)}));

  rules.push_back(makeRule("boolean-literals",
                           "TRUE, FALSE -> true, false",
                           {protectQuotedIdentifiers(makeTemplatePattern(R"(\bTRUE\b)", "true")),
                            protectQuotedIdentifiers(makeTemplatePattern(R"(\bFALSE\b)", "false"))}));

  rules.push_back(makeRule("regexp-operator",
                           "a REGEXP b -> a ~ b",
                           {makeTemplatePattern(R"(\sREGEXP\s)", " ~ ")}));

  rules.push_back(makeRule("table-options",
                           "drop ENGINE=... and DEFAULT CHARSET=...",
                           {makeTemplatePattern(R"(ENGINE\s*=\s*\w+)", ""),
                            makeTemplatePattern(R"(DEFAULT\s+CHARSET\s*=\s*\w+)", "")}));

  rules.push_back(makeRule("comment-spacing",
                           "-- comment spacing",
                           {makeTemplatePattern(R"(--[ \t])", "-- ", false)}));

  return rules;
}

RuleTable makeMySqlToPostgresRuleTable() {
  return RuleTable(makeMySqlToPostgresRules());
}

} // namespace pgconv
