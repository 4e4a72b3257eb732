#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "../seed/seed_stream.h"

namespace storage {

// Streaming form of seed::fnv1a64.
class Fnv1a64 {
public:
    void update(const void* data, size_t n) { h_ = seed::fnv1a64(data, n, h_); }
    uint64_t value() const { return h_; }

private:
    uint64_t h_ = seed::FNV1A64_OFFSET;
};

// Digest of a file's full contents. Throws core::NotFoundError if it cannot be opened.
uint64_t fileChecksum(const std::filesystem::path& path);

// 16 lowercase hex digits
std::string toHex(uint64_t value);

} // namespace storage
