#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "../grid/grid_tensor.h"

namespace storage {

// Tensor file layout (all little-endian):
//   char[4] "EGTN" | u32 version | u32 height | u32 width | u32 fields | u64 tick
//   | float32[height * width * fields] in tensor order
constexpr char TENSOR_MAGIC[4] = {'E', 'G', 'T', 'N'};
constexpr uint32_t TENSOR_VERSION = 1;
constexpr size_t TENSOR_HEADER_SIZE = 4 + 4 * 4 + 8;

struct TensorFile {
    uint64_t tick = 0;
    grid::GridTensor tensor;
};

// Throws core::StorageError on any write failure.
void writeTensorFile(const std::filesystem::path& path, const grid::GridTensor& tensor, uint64_t tick);

// Throws core::NotFoundError if the file is missing, core::CorruptionError if malformed.
TensorFile readTensorFile(const std::filesystem::path& path);

// Parses tensor file bytes; name is used in error messages. Throws core::CorruptionError.
TensorFile parseTensorBytes(const std::string& bytes, const std::string& name);

// Whole file as bytes. Throws core::NotFoundError if missing.
std::string readFileBytes(const std::filesystem::path& path);

// Little-endian primitives
void putU32(std::string& out, uint32_t v);
void putU64(std::string& out, uint64_t v);
uint32_t getU32(const unsigned char* p);
uint64_t getU64(const unsigned char* p);

} // namespace storage
