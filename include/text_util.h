#pragma once

#include <string>
#include <vector>

namespace rec {
namespace textutil {

std::string trim(const std::string& s);

std::string toLowerAscii(std::string s);

// lowercase, split on anything that is not an ASCII letter or digit
std::vector<std::string> tokenize(const std::string& text);

// Number of code points; continuation bytes (10xxxxxx) are not counted
size_t utf8Length(const std::string& s);

// Keep the first max_chars code points without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& s, size_t max_chars);

} // namespace textutil
} // namespace rec
