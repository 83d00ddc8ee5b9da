#include "pgconv/RewritePipeline.h"

#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

TEST_SUITE_BEGIN("pgconv.rewrite.pipeline");

TEST_CASE("pipeline returns empty text for empty input") {
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  CHECK(pipeline.rewrite("").empty());
}

TEST_CASE("pipeline passes through text without mysql syntax") {
  const std::string source = "SELECT a, b FROM t WHERE c = 1;\n";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  CHECK(pipeline.rewrite(source) == source);
}

TEST_CASE("free rewrite matches pipeline rewrite") {
  const std::string source = "id INT AUTO_INCREMENT";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  CHECK(pgconv::rewrite(source, rules) == pgconv::RewritePipeline(rules).rewrite(source));
}

TEST_CASE("unbalanced backticks and parentheses are left alone") {
  const std::string source = "SELECT `broken FROM t WHERE IFNULL(a";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  CHECK(pipeline.rewrite(source) == source);
}

TEST_CASE("trace reports every rule in order") {
  const std::string source = "`id` INT";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  const std::vector<pgconv::RewriteStage> stages = pipeline.trace(source);
  REQUIRE(stages.size() == rules.size());
  for (size_t i = 0; i < stages.size(); ++i) {
    CHECK(stages[i].ruleName == rules.rules()[i].name);
  }
  CHECK(stages[0].text == "\"id\" INT");
  CHECK(stages[0].changed);
  CHECK_FALSE(stages[1].changed);
  CHECK(stages[2].text == "\"id\" INTEGER");
  CHECK(stages[2].changed);
  CHECK_FALSE(stages[7].changed);
  CHECK(stages.back().text == pipeline.rewrite(source));
}

TEST_CASE("each rule sees the output of the previous rule") {
  std::vector<pgconv::RewriteRule> list(2);
  list[0].name = "a-to-b";
  list[0].patterns.push_back(pgconv::makeTemplatePattern("a", "b", false));
  list[1].name = "b-to-c";
  list[1].patterns.push_back(pgconv::makeTemplatePattern("b", "c", false));
  const pgconv::RuleTable rules(std::move(list));
  CHECK(pgconv::rewrite("ab", rules) == "cc");
}

TEST_CASE("swapping quoting and integer rules changes output") {
  const std::string source = "CREATE TABLE t (`int` INT);";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();

  std::vector<pgconv::RewriteRule> swappedList = pgconv::makeMySqlToPostgresRules();
  std::swap(swappedList[0], swappedList[2]);
  const pgconv::RuleTable swapped(std::move(swappedList));

  const std::string ordered = pgconv::rewrite(source, rules);
  const std::string reordered = pgconv::rewrite(source, swapped);
  CHECK(ordered == "CREATE TABLE t (\"int\" INTEGER);");
  CHECK(reordered == "CREATE TABLE t (\"INTEGER\" INTEGER);");
  CHECK(ordered != reordered);
}

TEST_CASE("second pass leaves converted schema unchanged") {
  const std::string source = "CREATE TABLE `users` (\n"
                             "  `id` INT AUTO_INCREMENT,\n"
                             "  `active` TINYINT(1) DEFAULT TRUE,\n"
                             "  `created` DATETIME\n"
                             ") ENGINE=InnoDB DEFAULT CHARSET=utf8;\n";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  const std::string once = pipeline.rewrite(source);
  CHECK(once == "CREATE TABLE \"users\" (\n"
                "  \"id\" INTEGER SERIAL,\n"
                "  \"active\" BOOLEAN DEFAULT true,\n"
                "  \"created\" TIMESTAMP\n"
                ")  ;\n");
  CHECK(pipeline.rewrite(once) == once);
}

TEST_CASE("unsigned rewrite converges after one pass") {
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  const std::string once = pipeline.rewrite("age INT UNSIGNED");
  CHECK(once.find("UNSIGNED") == std::string::npos);
  CHECK(pipeline.rewrite(once) == once);
}

TEST_CASE("comment spacing is idempotent") {
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  const std::string once = pipeline.rewrite("--\tnote\n-- other\n");
  CHECK(once == "-- note\n-- other\n");
  CHECK(pipeline.rewrite(once) == once);
}

TEST_CASE("pipeline handles non ascii text") {
  const std::string source = "INSERT INTO t VALUES ('h\xC3\xA9llo', '\xE2\x9C\x93');";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  CHECK(pgconv::rewrite(source, rules) == source);
}

TEST_CASE("pipeline only binds to a named rule table") {
  static_assert(std::is_constructible_v<pgconv::RewritePipeline, const pgconv::RuleTable &>);
  static_assert(std::is_constructible_v<pgconv::RewritePipeline, pgconv::RuleTable &>);
  static_assert(!std::is_constructible_v<pgconv::RewritePipeline, pgconv::RuleTable &&>);
  static_assert(!std::is_constructible_v<pgconv::RewritePipeline, const pgconv::RuleTable &&>);
  static_assert(!std::is_convertible_v<const pgconv::RuleTable &, pgconv::RewritePipeline>);
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  const pgconv::RewritePipeline pipeline(rules);
  CHECK(&pipeline.rules() == &rules);
}

TEST_CASE("row with a megabyte string value") {
  const std::string value(1 << 20, 'x');
  const std::string source = "INSERT INTO `docs` VALUES (1,'" + value + "');\n";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  CHECK(pipeline.rewrite(source) == "INSERT INTO \"docs\" VALUES (1,'" + value + "');\n");
}

TEST_CASE("megabyte line with an unbalanced backtick") {
  const std::string source = "`" + std::string(1 << 20, 'a');
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  CHECK(pipeline.rewrite(source) == source);
}

TEST_CASE("keyword dense megabyte line rewrites in bounded time") {
  std::string source = "INSERT INTO flags VALUES ";
  std::string expected = source;
  while (source.size() < (1u << 20)) {
    source += "(TRUE,FALSE),";
    expected += "(true,false),";
  }
  source += "(TRUE,FALSE);";
  expected += "(true,false);";
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  pgconv::RewritePipeline pipeline(rules);
  const auto started = std::chrono::steady_clock::now();
  const std::string output = pipeline.rewrite(source);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  CHECK(output == expected);
  CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("quoted identifiers stay protected on a long line") {
  std::string source;
  std::string expected;
  for (int i = 0; i < 20000; ++i) {
    source += "\"int\" INT, ";
    expected += "\"int\" INTEGER, ";
  }
  const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
  CHECK(pgconv::rewrite(source, rules) == expected);
}

TEST_SUITE_END();
