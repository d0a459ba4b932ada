#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <string>
#include <vector>

namespace prtcal {

// Trim leading and trailing whitespace.
std::string Trim(const std::string& text);

// Lowercase a string (ASCII-safe).
std::string ToLower(const std::string& text);

// Uppercase a string (ASCII-safe).
std::string ToUpper(const std::string& text);

bool ContainsCaseInsensitive(const std::string& text, const std::string& needle);

bool StartsWith(const std::string& text, const std::string& prefix);

// Split on runs of whitespace; empty tokens are never produced.
std::vector<std::string> SplitWhitespace(const std::string& text);

// Split on any of the characters in `delimiters`, collapsing empty fields.
std::vector<std::string> SplitAny(const std::string& text, const std::string& delimiters);

// Strict full-token numeric parse (accepts Fortran-style 'D' exponents).
// Non-finite values (nan, inf) are rejected.
bool ParseDouble(const std::string& token, double* value);

// Integral value of a numeric token ("40", "4e1"); false for fractions or
// values outside the int range.
bool ParseInt(const std::string& token, int* value);

}  // namespace prtcal

#endif
