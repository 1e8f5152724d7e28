#pragma once

#include <string>
#include <vector>

namespace scholar_parser {

// ASCII whitespace: space, \t, \n, \v, \f, \r and the separators \x1c-\x1f
bool is_space(char c);

// Byte length of the whitespace code point starting at `pos`, or 0. Covers
// ASCII whitespace plus U+0085, U+00A0, U+1680, U+2000-U+200A, U+2028,
// U+2029, U+202F, U+205F and U+3000.
size_t whitespace_length(const std::string& text, size_t pos);

// Byte length of the line break starting at `pos`, or 0: \n, \r, \v, \f,
// \x1c-\x1e, U+0085, U+2028 and U+2029
size_t line_break_length(const std::string& text, size_t pos);

// Collapse every whitespace run into one space and trim both ends.
// Idempotent and never makes the string longer.
std::string normalize_whitespace(const std::string& value);

std::string trim(const std::string& value);

std::string to_lower_ascii(const std::string& value);

bool starts_with_ignore_case(const std::string& value, const std::string& prefix);

// Split on line breaks, trim each line and drop empty ones
std::vector<std::string> split_lines(const std::string& text);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& value);

// Copy of `value` with every malformed UTF-8 sequence replaced by U+FFFD
std::string to_valid_utf8(const std::string& value);

} // namespace scholar_parser
