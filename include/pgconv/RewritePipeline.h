#pragma once

#include <string>
#include <vector>

#include "pgconv/RuleTable.h"

namespace pgconv {

struct RewriteStage {
  std::string ruleName;
  std::string text;
  bool changed = false;
};

// Applies every rule of the table, in order, each one to the output of the
// previous one. The table must outlive the pipeline, so temporaries are
// rejected.
class RewritePipeline {
public:
  explicit RewritePipeline(const RuleTable &rules) : rules_(rules) {}
  RewritePipeline(RuleTable &&) = delete;
  RewritePipeline(const RuleTable &&) = delete;

  std::string rewrite(const std::string &source) const;
  std::vector<RewriteStage> trace(const std::string &source) const;

  const RuleTable &rules() const {
    return rules_;
  }

private:
  const RuleTable &rules_;
};

std::string rewrite(const std::string &source, const RuleTable &rules);

} // namespace pgconv
