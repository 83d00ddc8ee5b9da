#include "RewriteHelpers.h"

#include <cctype>

namespace pgconv::scan {

size_t findLineStart(const std::string &text, size_t index) {
  if (index > text.size()) {
    index = text.size();
  }
  while (index > 0 && text[index - 1] != '\n') {
    --index;
  }
  return index;
}

void QuotedIdentifierScanner::restartAt(size_t lineStart) {
  pos_ = lineStart;
  backslashes_ = 0;
  inIdentifier_ = false;
  inString_ = false;
}

// Single-quoted strings are tracked so that a double quote inside a string
// literal does not open an identifier.
bool QuotedIdentifierScanner::insideAt(size_t index) {
  if (index >= text_.size()) {
    return false;
  }
  if (index < pos_) {
    restartAt(findLineStart(text_, index));
  }
  for (; pos_ < index; ++pos_) {
    char c = text_[pos_];
    if (c == '\n') {
      inIdentifier_ = false;
      inString_ = false;
    } else if (c == '"' && !inString_) {
      inIdentifier_ = !inIdentifier_;
    } else if (c == '\'' && !inIdentifier_ && (backslashes_ % 2) == 0) {
      inString_ = !inString_;
    }
    backslashes_ = c == '\\' ? backslashes_ + 1 : 0;
  }
  return inIdentifier_;
}

bool isInsideQuotedIdentifier(const std::string &text, size_t index) {
  QuotedIdentifierScanner scanner(text);
  return scanner.insideAt(index);
}

std::string trimWhitespace(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

} // namespace pgconv::scan
