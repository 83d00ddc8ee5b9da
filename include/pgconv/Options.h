#pragma once

#include <string>

namespace pgconv {
struct Options {
  std::string inputPath;
  std::string outputPath;
  std::string dumpAfter;
  bool verbose = false;
  bool listRules = false;
  bool showHelp = false;
};
} // namespace pgconv
