#include "checksum.h"
#include "../core/errors.h"
#include <cstdio>
#include <fstream>
#include <vector>

namespace storage {

uint64_t fileChecksum(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw core::NotFoundError("cannot open " + path.string());
    }

    Fnv1a64 digest;
    std::vector<char> buffer(1 << 16);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0) digest.update(buffer.data(), static_cast<size_t>(got));
    }
    return digest.value();
}

std::string toHex(uint64_t value) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return std::string(buf);
}

} // namespace storage
