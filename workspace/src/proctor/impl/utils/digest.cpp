#include "utils/digest.h"
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <sstream>
#include <iomanip>
#include <vector>
#include <stdexcept>

namespace proctor {
namespace utils {

namespace {

std::string toHex(const unsigned char* bytes, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

} // namespace

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string randomHex(size_t byteCount) {
    std::vector<unsigned char> bytes(byteCount);
    if (byteCount > 0 && RAND_bytes(bytes.data(), static_cast<int>(byteCount)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
    return toHex(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace proctor
