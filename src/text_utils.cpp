#include "paper_splitter/text_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace paper_splitter {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string first_token(const std::string& text, const std::string& fallback) {
    std::istringstream stream(text);
    std::string token;
    if (stream >> token) {
        return token;
    }
    return fallback;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace paper_splitter
