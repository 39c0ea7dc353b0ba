#include "crypto/util/hash.hpp"
#include "util/errors.hpp"

#include <sodium.h>
#include <fstream>
#include <mutex>

namespace fsnap::crypto::hash {

namespace {

void ensureSodium() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });
}

}

std::vector<uint8_t> blake2b(const std::filesystem::path& filepath) {
    ensureSodium();

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw ScanIOError("Failed to open file for hashing: " + filepath.string());

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, DIGEST_BYTES);

    std::vector<char> buffer(CHUNK_BYTES);
    while (file.good()) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.bad()) throw ScanIOError("Failed to read file for hashing: " + filepath.string());
        crypto_generichash_update(&state, reinterpret_cast<unsigned char*>(buffer.data()),
                                  static_cast<unsigned long long>(file.gcount()));
    }

    std::vector<uint8_t> hash(DIGEST_BYTES);
    crypto_generichash_final(&state, hash.data(), hash.size());
    return hash;
}

}
