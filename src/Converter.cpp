#include "pgconv/Converter.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace pgconv {
namespace {
bool checkInputFile(const std::string &path, ConvertReport &report, std::string &error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    report.error = ConvertError::InputNotFound;
    error = "Input file " + path + " not found";
    return false;
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    report.error = ConvertError::Io;
    error = "input is not a regular file: " + path;
    return false;
  }
  return true;
}
} // namespace

std::string defaultOutputPath(const std::string &inputPath) {
  std::filesystem::path path(inputPath);
  path.replace_extension(".psql");
  return path.string();
}

const char *convertErrorLabel(ConvertError error) {
  switch (error) {
  case ConvertError::None:
    return "none";
  case ConvertError::InputNotFound:
    return "Input error";
  case ConvertError::Io:
    return "I/O error";
  case ConvertError::Unexpected:
    return "Error during conversion";
  }
  return "Error during conversion";
}

bool readTextFile(const std::string &path, std::string &out, std::string &error) {
  std::ifstream file(path);
  if (!file) {
    error = "failed to open input file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    error = "failed to read input file: " + path;
    return false;
  }
  out = buffer.str();
  return true;
}

bool writeTextFile(const std::string &path, const std::string &contents, std::string &error) {
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    error = "failed to open output file: " + path;
    return false;
  }
  file << contents;
  file.flush();
  if (!file.good()) {
    error = "failed to write output file: " + path;
    return false;
  }
  return true;
}

bool convertFile(const Options &options,
                 const RewritePipeline &pipeline,
                 ConvertReport &report,
                 std::string &error) {
  report = ConvertReport{};
  report.inputPath = options.inputPath;
  report.outputPath = options.outputPath.empty() ? defaultOutputPath(options.inputPath) : options.outputPath;
  if (!checkInputFile(options.inputPath, report, error)) {
    return false;
  }

  std::string source;
  if (!readTextFile(options.inputPath, source, error)) {
    report.error = ConvertError::Io;
    return false;
  }

  std::string converted;
  try {
    if (options.verbose) {
      std::vector<RewriteStage> stages = pipeline.trace(source);
      for (const auto &stage : stages) {
        if (stage.changed) {
          report.changedRules.push_back(stage.ruleName);
        }
      }
      converted = stages.empty() ? source : stages.back().text;
    } else {
      converted = pipeline.rewrite(source);
    }
  } catch (const std::exception &ex) {
    report.error = ConvertError::Unexpected;
    error = ex.what();
    return false;
  }

  if (!writeTextFile(report.outputPath, converted, error)) {
    report.error = ConvertError::Io;
    return false;
  }
  return true;
}

bool dumpAfterRule(const Options &options,
                   const RewritePipeline &pipeline,
                   ConvertReport &report,
                   std::string &out,
                   std::string &error) {
  report = ConvertReport{};
  report.inputPath = options.inputPath;
  const RewriteRule *target = pipeline.rules().find(options.dumpAfter);
  if (target == nullptr) {
    report.error = ConvertError::Unexpected;
    error = "unknown rule: " + options.dumpAfter;
    return false;
  }
  if (!checkInputFile(options.inputPath, report, error)) {
    return false;
  }
  std::string source;
  if (!readTextFile(options.inputPath, source, error)) {
    report.error = ConvertError::Io;
    return false;
  }
  try {
    for (auto &stage : pipeline.trace(source)) {
      if (stage.changed) {
        report.changedRules.push_back(stage.ruleName);
      }
      if (stage.ruleName == target->name) {
        out = std::move(stage.text);
        return true;
      }
    }
  } catch (const std::exception &ex) {
    report.error = ConvertError::Unexpected;
    error = ex.what();
    return false;
  }
  report.error = ConvertError::Unexpected;
  error = "unknown rule: " + options.dumpAfter;
  return false;
}

} // namespace pgconv
