#pragma once

#include <string>
#include <vector>

#include "pgconv/Options.h"
#include "pgconv/RewritePipeline.h"

namespace pgconv {

enum class ConvertError { None, InputNotFound, Io, Unexpected };

struct ConvertReport {
  ConvertError error = ConvertError::None;
  std::string inputPath;
  std::string outputPath;
  std::vector<std::string> changedRules;
};

std::string defaultOutputPath(const std::string &inputPath);
const char *convertErrorLabel(ConvertError error);

bool readTextFile(const std::string &path, std::string &out, std::string &error);
bool writeTextFile(const std::string &path, const std::string &contents, std::string &error);

// Reads options.inputPath, rewrites it and writes the result to
// options.outputPath (or the default .psql path when empty).
bool convertFile(const Options &options,
                 const RewritePipeline &pipeline,
                 ConvertReport &report,
                 std::string &error);

// Rewrites options.inputPath and returns the text as it stood after the rule
// named by options.dumpAfter. Nothing is written. On failure report.error
// holds the category.
bool dumpAfterRule(const Options &options,
                   const RewritePipeline &pipeline,
                   ConvertReport &report,
                   std::string &out,
                   std::string &error);

} // namespace pgconv
