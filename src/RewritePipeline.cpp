#include "pgconv/RewritePipeline.h"

#include <utility>

namespace pgconv {

std::string RewritePipeline::rewrite(const std::string &source) const {
  std::string text = source;
  for (const auto &rule : rules_.rules()) {
    text = rule.apply(text);
  }
  return text;
}

std::vector<RewriteStage> RewritePipeline::trace(const std::string &source) const {
  std::vector<RewriteStage> stages;
  stages.reserve(rules_.size());
  std::string text = source;
  for (const auto &rule : rules_.rules()) {
    RewriteStage stage;
    stage.ruleName = rule.name;
    stage.text = rule.apply(text);
    stage.changed = stage.text != text;
    text = stage.text;
    stages.push_back(std::move(stage));
  }
  return stages;
}

std::string rewrite(const std::string &source, const RuleTable &rules) {
  return RewritePipeline(rules).rewrite(source);
}

} // namespace pgconv
