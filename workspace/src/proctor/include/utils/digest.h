#ifndef PROCTOR_UTILS_DIGEST_H
#define PROCTOR_UTILS_DIGEST_H

#include <string>

namespace proctor {
namespace utils {

/**
 * @brief Lower-case hex SHA-256 of data
 */
std::string sha256Hex(const std::string& data);

/**
 * @brief Hex string of byteCount cryptographically random bytes
 * @throws std::runtime_error if the random generator fails
 */
std::string randomHex(size_t byteCount);

} // namespace utils
} // namespace proctor

#endif // PROCTOR_UTILS_DIGEST_H
