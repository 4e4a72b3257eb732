#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../grid/grid_tensor.h"

namespace storage {

struct DeltaEntry {
    uint32_t row = 0;
    uint32_t col = 0;
    uint32_t field = 0;
    float value = 0.0f;   // New value, not a difference
};

// Changes that turn tick-1 into tick. Entries are in tensor order.
struct DeltaRecord {
    uint64_t tick = 0;
    std::vector<DeltaEntry> entries;
};

// Frame layout (little-endian):
//   char[4] "EGDL" | u64 tick | u32 count | count x (u32 row, u32 col, u32 field, u32 value bits)
constexpr char DELTA_MAGIC[4] = {'E', 'G', 'D', 'L'};
constexpr size_t DELTA_FRAME_HEADER = 4 + 8 + 4;
constexpr size_t DELTA_ENTRY_SIZE = 16;

class DeltaEncoder {
public:
    // Every value whose bit pattern differs between the two tensors.
    // Throws core::StateError on shape mismatch.
    static DeltaRecord encode(const grid::GridTensor& previous, const grid::GridTensor& next, uint64_t tick);

    // Writes each entry's value into the tensor. Throws core::CorruptionError
    // for entries outside the tensor.
    static void apply(grid::GridTensor& tensor, const DeltaRecord& record);

    static std::string serialize(const DeltaRecord& record);
};

/**
 * @brief Sequential reader over a concatenation of delta frames.
 *
 * With allowPartialTail an incomplete trailing frame ends the stream
 * (a run killed mid-write); otherwise it is a core::CorruptionError.
 * The reader owns its byte buffer.
 */
class DeltaLogReader {
public:
    DeltaLogReader(std::string bytes, bool allowPartialTail);

    // False at end of stream.
    bool next(DeltaRecord& out);

    // Reads the next frame's tick without decoding its entries.
    bool skip(uint64_t& tick);

    size_t offset() const { return offset_; }

private:
    // Validates the frame header at offset_; returns the entry count or false at end.
    bool frameHeader(uint64_t& tick, uint32_t& count);

    std::string bytes_;
    bool allowPartialTail_;
    size_t offset_ = 0;
};

} // namespace storage
