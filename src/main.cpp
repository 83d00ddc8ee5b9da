#include "pgconv/Converter.h"
#include "pgconv/Options.h"
#include "pgconv/RewritePipeline.h"
#include "pgconv/RuleTable.h"

#include <exception>
#include <iostream>
#include <string>

namespace {
constexpr const char *kUsage =
    "Usage: pgconv <input.sql> [-o|--output <output.psql>] [-v|--verbose] [--dump-after <rule>] "
    "[--list-rules] [-h|--help]\n";

bool parseArgs(int argc, char **argv, pgconv::Options &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      out.showHelp = true;
    } else if (arg == "-v" || arg == "--verbose") {
      out.verbose = true;
    } else if (arg == "--list-rules") {
      out.listRules = true;
    } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
      out.outputPath = argv[++i];
    } else if (arg.rfind("--output=", 0) == 0) {
      out.outputPath = arg.substr(std::string("--output=").size());
    } else if (arg == "--dump-after" && i + 1 < argc) {
      out.dumpAfter = argv[++i];
    } else if (arg.rfind("--dump-after=", 0) == 0) {
      out.dumpAfter = arg.substr(std::string("--dump-after=").size());
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown or incomplete option: " + arg;
      return false;
    } else {
      if (!out.inputPath.empty()) {
        error = "unexpected extra argument: " + arg;
        return false;
      }
      out.inputPath = arg;
    }
  }
  if (out.showHelp || out.listRules) {
    return true;
  }
  if (out.inputPath.empty()) {
    error = "missing input file";
    return false;
  }
  return true;
}

void printRules(const pgconv::RuleTable &rules) {
  size_t position = 1;
  for (const auto &rule : rules.rules()) {
    std::cout << position << " " << rule.name << ": " << rule.summary << "\n";
    ++position;
  }
}
} // namespace

int main(int argc, char **argv) {
  pgconv::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    std::cerr << "Argument error: " << argError << "\n";
    std::cerr << kUsage;
    return 2;
  }
  if (options.showHelp) {
    std::cout << kUsage;
    return 0;
  }

  try {
    const pgconv::RuleTable rules = pgconv::makeMySqlToPostgresRuleTable();
    if (options.listRules) {
      printRules(rules);
      return 0;
    }
    const pgconv::RewritePipeline pipeline(rules);

    std::string error;
    if (!options.dumpAfter.empty()) {
      if (rules.find(options.dumpAfter) == nullptr) {
        std::cerr << "Argument error: unknown rule: " << options.dumpAfter << "\n";
        return 2;
      }
      pgconv::ConvertReport report;
      std::string text;
      if (!pgconv::dumpAfterRule(options, pipeline, report, text, error)) {
        std::cerr << pgconv::convertErrorLabel(report.error) << ": " << error << "\n";
        return 1;
      }
      std::cout << text;
      return 0;
    }

    pgconv::ConvertReport report;
    if (!pgconv::convertFile(options, pipeline, report, error)) {
      std::cerr << pgconv::convertErrorLabel(report.error) << ": " << error << "\n";
      return 1;
    }
    if (options.verbose) {
      for (const auto &name : report.changedRules) {
        std::cout << "applied " << name << "\n";
      }
      std::cout << "Successfully converted MySQL file " << report.inputPath << " to PostgreSQL file "
                << report.outputPath << "\n";
    }
  } catch (const std::exception &ex) {
    std::cerr << "Error during conversion: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
