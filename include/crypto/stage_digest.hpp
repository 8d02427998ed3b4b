#pragma once
#include "events/events.hpp"
#include <string>

namespace stagelink {

class StageDigest {
public:
    // BLAKE2b (libsodium generichash) of config_path + '\0' + stage, hex
    // encoded. Independent CLI invocations derive the same registry file name.
    static std::string compute(const StageKey& key);

    static constexpr size_t DIGEST_BYTES = 16;

private:
    static std::string toHex(const unsigned char* bytes, size_t length);
};

} // namespace stagelink
