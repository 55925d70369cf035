#pragma once

#include <string>

namespace paper_splitter {

std::string trim(const std::string& text);

// First whitespace-delimited token, or `fallback` when there is none.
std::string first_token(const std::string& text, const std::string& fallback);

std::string to_upper(std::string text);

} // namespace paper_splitter
