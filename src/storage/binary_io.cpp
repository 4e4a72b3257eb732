#include "binary_io.h"
#include "../core/errors.h"
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace storage {

void putU32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (i * 8)) & 0xFFu));
    }
}

void putU64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (i * 8)) & 0xFFu));
    }
}

uint32_t getU32(const unsigned char* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(p[i]) << (i * 8);
    }
    return v;
}

uint64_t getU64(const unsigned char* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    }
    return v;
}

void writeTensorFile(const std::filesystem::path& path, const grid::GridTensor& tensor, uint64_t tick) {
    std::string bytes;
    bytes.reserve(TENSOR_HEADER_SIZE + tensor.size() * 4);
    bytes.append(TENSOR_MAGIC, 4);
    putU32(bytes, TENSOR_VERSION);
    putU32(bytes, static_cast<uint32_t>(tensor.height()));
    putU32(bytes, static_cast<uint32_t>(tensor.width()));
    putU32(bytes, static_cast<uint32_t>(tensor.fields()));
    putU64(bytes, tick);
    for (float v : tensor.data()) {
        putU32(bytes, grid::floatBits(v));
    }

    // Written aside and renamed, so a reader never sees a half-written tensor
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw core::StorageError("cannot create " + tmp.string());
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            throw core::StorageError("failed writing " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw core::StorageError("cannot move " + tmp.string() + " into place: " + ec.message());
    }
}

std::string readFileBytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw core::NotFoundError("missing file " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

TensorFile readTensorFile(const std::filesystem::path& path) {
    return parseTensorBytes(readFileBytes(path), path.filename().string());
}

TensorFile parseTensorBytes(const std::string& bytes, const std::string& name) {
    if (bytes.size() < TENSOR_HEADER_SIZE || std::memcmp(bytes.data(), TENSOR_MAGIC, 4) != 0) {
        throw core::CorruptionError(name + ": not a tensor file");
    }

    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    uint32_t version = getU32(p + 4);
    if (version != TENSOR_VERSION) {
        throw core::CorruptionError(name + ": unsupported tensor version " + std::to_string(version));
    }
    const uint32_t h = getU32(p + 8);
    const uint32_t w = getU32(p + 12);
    const uint32_t f = getU32(p + 16);
    const uint64_t count = static_cast<uint64_t>(h) * w * f;
    if (bytes.size() != TENSOR_HEADER_SIZE + count * 4) {
        throw core::CorruptionError(name + ": payload size does not match header");
    }

    TensorFile out;
    out.tick = getU64(p + 20);
    out.tensor = grid::GridTensor(static_cast<int>(h), static_cast<int>(w), static_cast<int>(f));
    auto& data = out.tensor.data();
    const unsigned char* payload = p + TENSOR_HEADER_SIZE;
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = grid::floatFromBits(getU32(payload + i * 4));
    }
    return out;
}

} // namespace storage
