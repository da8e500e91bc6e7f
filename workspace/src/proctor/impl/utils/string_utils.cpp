#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace proctor {
namespace utils {

namespace {

const char* const WHITESPACE = " \t\r\n\f\v";

bool isShellSafe(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '-' || c == '.' || c == '/' || c == ':' ||
           c == '=' || c == '+' || c == ',' || c == '@' || c == '%';
}

} // namespace

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(WHITESPACE);
    return s.substr(start, end - start + 1);
}

std::string rtrim(const std::string& s) {
    auto end = s.find_last_not_of(WHITESPACE);
    if (end == std::string::npos) {
        return "";
    }
    return s.substr(0, end + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start <= text.size()) {
        auto pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        std::string line = text.substr(start, pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        start = pos + 1;
    }
    return lines;
}

std::string shellQuote(const std::string& arg) {
    if (!arg.empty() && std::all_of(arg.begin(), arg.end(), isShellSafe)) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string shellJoin(const std::vector<std::string>& argv) {
    std::string joined;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            joined += ' ';
        }
        joined += shellQuote(argv[i]);
    }
    return joined;
}

} // namespace utils
} // namespace proctor
