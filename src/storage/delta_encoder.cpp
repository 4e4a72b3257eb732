#include "delta_encoder.h"
#include "binary_io.h"
#include "../core/errors.h"
#include <cstring>
#include <utility>

namespace storage {

DeltaRecord DeltaEncoder::encode(const grid::GridTensor& previous, const grid::GridTensor& next, uint64_t tick) {
    if (!previous.sameShape(next)) {
        throw core::StateError("delta encode: tensor shapes differ");
    }

    DeltaRecord record;
    record.tick = tick;

    const int fields = next.fields();
    const auto& a = previous.data();
    const auto& b = next.data();
    for (size_t i = 0; i < b.size(); ++i) {
        if (grid::floatBits(a[i]) == grid::floatBits(b[i])) continue;

        const size_t cell = i / static_cast<size_t>(fields);
        DeltaEntry e;
        e.row = static_cast<uint32_t>(cell / static_cast<size_t>(next.width()));
        e.col = static_cast<uint32_t>(cell % static_cast<size_t>(next.width()));
        e.field = static_cast<uint32_t>(i % static_cast<size_t>(fields));
        e.value = b[i];
        record.entries.push_back(e);
    }
    return record;
}

void DeltaEncoder::apply(grid::GridTensor& tensor, const DeltaRecord& record) {
    for (const auto& e : record.entries) {
        if (e.row >= static_cast<uint32_t>(tensor.height()) ||
            e.col >= static_cast<uint32_t>(tensor.width()) ||
            e.field >= static_cast<uint32_t>(tensor.fields())) {
            throw core::CorruptionError("delta for tick " + std::to_string(record.tick) +
                                        " addresses a cell outside the grid");
        }
        tensor.at(static_cast<int>(e.row), static_cast<int>(e.col), static_cast<int>(e.field)) = e.value;
    }
}

std::string DeltaEncoder::serialize(const DeltaRecord& record) {
    std::string out;
    out.reserve(DELTA_FRAME_HEADER + record.entries.size() * DELTA_ENTRY_SIZE);
    out.append(DELTA_MAGIC, 4);
    putU64(out, record.tick);
    putU32(out, static_cast<uint32_t>(record.entries.size()));
    for (const auto& e : record.entries) {
        putU32(out, e.row);
        putU32(out, e.col);
        putU32(out, e.field);
        putU32(out, grid::floatBits(e.value));
    }
    return out;
}

DeltaLogReader::DeltaLogReader(std::string bytes, bool allowPartialTail)
    : bytes_(std::move(bytes)), allowPartialTail_(allowPartialTail) {
}

bool DeltaLogReader::frameHeader(uint64_t& tick, uint32_t& count) {
    const size_t remaining = bytes_.size() - offset_;
    if (remaining == 0) return false;

    if (remaining < DELTA_FRAME_HEADER) {
        if (allowPartialTail_) return false;
        throw core::CorruptionError("delta log truncated inside a frame header");
    }
    const auto* p = reinterpret_cast<const unsigned char*>(bytes_.data()) + offset_;
    if (std::memcmp(p, DELTA_MAGIC, 4) != 0) {
        throw core::CorruptionError("delta log: bad frame magic at byte " + std::to_string(offset_));
    }
    tick = getU64(p + 4);
    count = getU32(p + 12);

    const uint64_t body = static_cast<uint64_t>(count) * DELTA_ENTRY_SIZE;
    if (remaining - DELTA_FRAME_HEADER < body) {
        if (allowPartialTail_) return false;
        throw core::CorruptionError("delta log truncated in frame for tick " + std::to_string(tick));
    }
    return true;
}

bool DeltaLogReader::next(DeltaRecord& out) {
    uint64_t tick = 0;
    uint32_t count = 0;
    if (!frameHeader(tick, count)) return false;

    out.tick = tick;
    out.entries.resize(count);
    const auto* p = reinterpret_cast<const unsigned char*>(bytes_.data()) + offset_ + DELTA_FRAME_HEADER;
    for (uint32_t i = 0; i < count; ++i) {
        DeltaEntry& e = out.entries[i];
        e.row = getU32(p);
        e.col = getU32(p + 4);
        e.field = getU32(p + 8);
        e.value = grid::floatFromBits(getU32(p + 12));
        p += DELTA_ENTRY_SIZE;
    }
    offset_ += DELTA_FRAME_HEADER + static_cast<size_t>(count) * DELTA_ENTRY_SIZE;
    return true;
}

bool DeltaLogReader::skip(uint64_t& tick) {
    uint32_t count = 0;
    if (!frameHeader(tick, count)) return false;
    offset_ += DELTA_FRAME_HEADER + static_cast<size_t>(count) * DELTA_ENTRY_SIZE;
    return true;
}

} // namespace storage
