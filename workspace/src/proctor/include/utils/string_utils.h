#ifndef PROCTOR_STRING_UTILS_H
#define PROCTOR_STRING_UTILS_H

#include <string>
#include <vector>

namespace proctor {
namespace utils {

/**
 * @brief Strip leading and trailing whitespace (" \t\r\n\f\v")
 */
std::string trim(const std::string& s);

/**
 * @brief Strip trailing whitespace only
 */
std::string rtrim(const std::string& s);

std::string toLower(std::string s);

/**
 * @brief Case-insensitive substring test
 */
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

/**
 * @brief Split on '\n', accepting "\r\n" line endings
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Quote one argument for /bin/sh (POSIX single-quote rules)
 *
 * Arguments made only of safe characters are returned unchanged.
 */
std::string shellQuote(const std::string& arg);

/**
 * @brief Shell-quote each argument and join with spaces
 */
std::string shellJoin(const std::vector<std::string>& argv);

} // namespace utils
} // namespace proctor

#endif // PROCTOR_STRING_UTILS_H
