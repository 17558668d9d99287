#include "taskrelay/utils/hash.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace taskrelay {
namespace utils {

std::string sha1_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_length, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("SHA-1 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace taskrelay
