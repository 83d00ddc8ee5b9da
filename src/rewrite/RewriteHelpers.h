#pragma once

#include <string>

namespace pgconv::scan {

size_t findLineStart(const std::string &text, size_t index);
bool isInsideQuotedIdentifier(const std::string &text, size_t index);
std::string trimWhitespace(const std::string &text);

// Walks a line forward and reports whether an offset sits inside a
// "double quoted" identifier. Offsets passed to insideAt should not decrease;
// when one does, the scan restarts at that offset's line.
class QuotedIdentifierScanner {
public:
  explicit QuotedIdentifierScanner(const std::string &text) : text_(text) {}

  bool insideAt(size_t index);

private:
  void restartAt(size_t lineStart);

  const std::string &text_;
  size_t pos_ = 0;
  size_t backslashes_ = 0;
  bool inIdentifier_ = false;
  bool inString_ = false;
};

} // namespace pgconv::scan
