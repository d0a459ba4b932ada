#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace prtcal {

std::string Trim(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string ToLower(const std::string& text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string ToUpper(const std::string& text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

bool ContainsCaseInsensitive(const std::string& text, const std::string& needle) {
  if (needle.empty()) return true;
  return ToLower(text).find(ToLower(needle)) != std::string::npos;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> SplitWhitespace(const std::string& text) {
  std::vector<std::string> tokens;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
      ++i;
    }
    const size_t start = i;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
      ++i;
    }
    if (i > start) {
      tokens.push_back(text.substr(start, i - start));
    }
  }
  return tokens;
}

std::vector<std::string> SplitAny(const std::string& text, const std::string& delimiters) {
  std::vector<std::string> tokens;
  std::string current;
  for (char ch : text) {
    if (delimiters.find(ch) != std::string::npos) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

bool ParseDouble(const std::string& token, double* value) {
  if (token.empty()) {
    return false;
  }
  std::string normalized = token;
  for (char& ch : normalized) {
    if (ch == 'D' || ch == 'd') {
      ch = 'e';
    }
  }
  const char* begin = normalized.c_str();
  char* end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end == begin || *end != '\0') {
    return false;
  }
  if (!std::isfinite(parsed)) {
    return false;
  }
  if (value) {
    *value = parsed;
  }
  return true;
}

bool ParseInt(const std::string& token, int* value) {
  double parsed = 0.0;
  if (!ParseDouble(token, &parsed)) {
    return false;
  }
  if (parsed < static_cast<double>(std::numeric_limits<int>::min()) ||
      parsed > static_cast<double>(std::numeric_limits<int>::max())) {
    return false;
  }
  const int as_int = static_cast<int>(parsed);
  if (static_cast<double>(as_int) != parsed) {
    return false;
  }
  if (value) {
    *value = as_int;
  }
  return true;
}

}  // namespace prtcal
