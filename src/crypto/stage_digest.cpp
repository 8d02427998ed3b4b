#include "crypto/stage_digest.hpp"
#include "utils/logging.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace stagelink {

std::string StageDigest::compute(const StageKey& key) {
    // Initialize libsodium if not already done
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    // The separator keeps ("a", "bc") and ("ab", "c") apart
    std::string material = key.config_path;
    material.push_back('\0');
    material += key.stage;

    std::vector<unsigned char> digest(DIGEST_BYTES);
    if (crypto_generichash(
            digest.data(), digest.size(),
            reinterpret_cast<const unsigned char*>(material.data()), material.size(),
            nullptr, 0) != 0) {
        throw std::runtime_error("Failed to hash stage key");
    }

    std::string hex = toHex(digest.data(), digest.size());
    DEBUG_DEBUG("Stage " << key.stage << " of " << key.config_path << " -> " << hex);
    return hex;
}

std::string StageDigest::toHex(const unsigned char* bytes, size_t length) {
    std::vector<char> hex(length * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), bytes, length);
    return std::string(hex.data(), length * 2);
}

} // namespace stagelink
