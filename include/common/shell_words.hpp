#pragma once

#include <string>
#include <vector>

namespace snapkeep {
namespace shell {

// POSIX-shell style word splitting: whitespace separates words, single quotes
// are literal, double quotes and backslashes escape. Throws
// std::invalid_argument on an unterminated quote or trailing backslash.
std::vector<std::string> split(const std::string& text);

// Quote a word so that split() returns it unchanged.
std::string quote(const std::string& word);

std::string join(const std::vector<std::string>& words);

} // namespace shell
} // namespace snapkeep
