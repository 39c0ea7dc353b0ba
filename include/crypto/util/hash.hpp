#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace fsnap::crypto::hash {

// 128-bit BLAKE2b fingerprint
inline constexpr size_t DIGEST_BYTES = 16;

// Bytes read per update; large enough to amortize the read syscalls.
inline constexpr size_t CHUNK_BYTES = 1024 * 1024;

// Streams the file through BLAKE2b. Throws ScanIOError if it cannot be opened or read.
std::vector<uint8_t> blake2b(const std::filesystem::path& filepath);

}
