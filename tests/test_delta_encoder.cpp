#include <iostream>
#include <cassert>
#include <string>
#include "../src/core/errors.h"
#include "../src/grid/grid_tensor.h"
#include "../src/storage/delta_encoder.h"

using namespace storage;

template <typename E, typename Fn>
bool throwsType(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

static grid::GridTensor ramp(int h, int w, int f) {
    grid::GridTensor t(h, w, f);
    for (size_t i = 0; i < t.size(); ++i) t.data()[i] = static_cast<float>(i) * 0.01f;
    return t;
}

void test_identical_tensors_have_empty_delta() {
    std::cout << "Running test_identical_tensors_have_empty_delta..." << std::endl;
    grid::GridTensor a = ramp(4, 5, 3);
    DeltaRecord r = DeltaEncoder::encode(a, a, 7);
    assert(r.tick == 7);
    assert(r.entries.empty());
    // An empty frame still has a header
    assert(DeltaEncoder::serialize(r).size() == DELTA_FRAME_HEADER);
    std::cout << "PASSED" << std::endl;
}

void test_single_change_addressed() {
    std::cout << "Running test_single_change_addressed..." << std::endl;
    grid::GridTensor a = ramp(4, 5, 3);
    grid::GridTensor b = a;
    b.at(2, 3, 1) = 0.999f;

    DeltaRecord r = DeltaEncoder::encode(a, b, 1);
    assert(r.entries.size() == 1);
    assert(r.entries[0].row == 2);
    assert(r.entries[0].col == 3);
    assert(r.entries[0].field == 1);
    assert(r.entries[0].value == 0.999f);
    std::cout << "PASSED" << std::endl;
}

void test_signed_zero_is_a_change() {
    std::cout << "Running test_signed_zero_is_a_change..." << std::endl;
    grid::GridTensor a(2, 2, 1, 0.0f);
    grid::GridTensor b = a;
    b.at(1, 0, 0) = -0.0f;

    DeltaRecord r = DeltaEncoder::encode(a, b, 1);
    assert(r.entries.size() == 1);
    grid::GridTensor c = a;
    DeltaEncoder::apply(c, r);
    assert(c.bitIdentical(b));
    std::cout << "PASSED" << std::endl;
}

void test_apply_reproduces_next() {
    std::cout << "Running test_apply_reproduces_next..." << std::endl;
    grid::GridTensor a = ramp(6, 7, 2);
    grid::GridTensor b = a;
    for (size_t i = 0; i < b.size(); i += 3) b.data()[i] *= 0.5f;

    DeltaRecord r = DeltaEncoder::encode(a, b, 3);
    grid::GridTensor rebuilt = a;
    DeltaEncoder::apply(rebuilt, r);
    assert(rebuilt.bitIdentical(b));
    std::cout << "PASSED" << std::endl;
}

void test_shape_mismatch_rejected() {
    std::cout << "Running test_shape_mismatch_rejected..." << std::endl;
    grid::GridTensor a(3, 3, 2);
    grid::GridTensor b(3, 4, 2);
    assert(throwsType<core::StateError>([&]() { DeltaEncoder::encode(a, b, 1); }));
    std::cout << "PASSED" << std::endl;
}

void test_apply_out_of_range() {
    std::cout << "Running test_apply_out_of_range..." << std::endl;
    grid::GridTensor t(3, 3, 2);
    DeltaRecord r;
    r.tick = 4;
    DeltaEntry e;
    e.row = 3;
    r.entries.push_back(e);
    assert(throwsType<core::CorruptionError>([&]() { DeltaEncoder::apply(t, r); }));

    r.entries[0].row = 0;
    r.entries[0].field = 2;
    assert(throwsType<core::CorruptionError>([&]() { DeltaEncoder::apply(t, r); }));
    std::cout << "PASSED" << std::endl;
}

void test_reader_walks_frames() {
    std::cout << "Running test_reader_walks_frames..." << std::endl;
    grid::GridTensor t0 = ramp(3, 3, 2);
    grid::GridTensor t1 = t0;
    t1.at(0, 0, 0) = 0.5f;
    grid::GridTensor t2 = t1;
    t2.at(2, 2, 1) = 0.25f;
    t2.at(1, 1, 0) = 0.75f;

    std::string log = DeltaEncoder::serialize(DeltaEncoder::encode(t0, t1, 1)) +
                      DeltaEncoder::serialize(DeltaEncoder::encode(t1, t2, 2));

    DeltaLogReader reader(log, false);
    DeltaRecord r;
    assert(reader.next(r) && r.tick == 1 && r.entries.size() == 1);
    assert(reader.next(r) && r.tick == 2 && r.entries.size() == 2);
    // Tensor order: (1,1,0) before (2,2,1)
    assert(r.entries[0].row == 1 && r.entries[1].row == 2);
    assert(!reader.next(r));
    assert(reader.offset() == log.size());

    DeltaLogReader skipper(log, false);
    uint64_t tick = 0;
    assert(skipper.skip(tick) && tick == 1);
    assert(skipper.next(r) && r.tick == 2);
    std::cout << "PASSED" << std::endl;
}

void test_partial_tail() {
    std::cout << "Running test_partial_tail..." << std::endl;
    grid::GridTensor t0 = ramp(3, 3, 1);
    grid::GridTensor t1 = t0;
    t1.at(1, 2, 0) = 0.4f;
    grid::GridTensor t2 = t1;
    t2.at(0, 1, 0) = 0.3f;

    std::string first = DeltaEncoder::serialize(DeltaEncoder::encode(t0, t1, 1));
    std::string second = DeltaEncoder::serialize(DeltaEncoder::encode(t1, t2, 2));
    std::string bodyCut = first + second.substr(0, second.size() - 5);
    std::string headerCut = first + second.substr(0, 6);

    for (const std::string* log : {&bodyCut, &headerCut}) {
        DeltaLogReader lenient(*log, true);
        DeltaRecord r;
        assert(lenient.next(r) && r.tick == 1);
        assert(!lenient.next(r));
        assert(lenient.offset() == first.size());

        DeltaLogReader strict(*log, false);
        assert(strict.next(r));
        assert(throwsType<core::CorruptionError>([&]() { strict.next(r); }));
    }
    std::cout << "PASSED" << std::endl;
}

static DeltaLogReader readerOverFreshLog(const grid::GridTensor& a, const grid::GridTensor& b) {
    // The serialized log is a temporary that dies before the reader is used
    return DeltaLogReader(DeltaEncoder::serialize(DeltaEncoder::encode(a, b, 1)), false);
}

void test_reader_outlives_source_buffer() {
    std::cout << "Running test_reader_outlives_source_buffer..." << std::endl;
    grid::GridTensor t0 = ramp(4, 4, 1);
    grid::GridTensor t1 = t0;
    t1.at(3, 2, 0) = 0.125f;

    DeltaLogReader reader = readerOverFreshLog(t0, t1);
    DeltaRecord r;
    assert(reader.next(r) && r.tick == 1 && r.entries.size() == 1);
    assert(r.entries[0].row == 3 && r.entries[0].col == 2);
    assert(!reader.next(r));

    std::string log = DeltaEncoder::serialize(DeltaEncoder::encode(t0, t1, 7));
    DeltaLogReader copy(log, false);
    log.assign(log.size(), 'X');
    uint64_t tick = 0;
    assert(copy.skip(tick) && tick == 7);
    std::cout << "PASSED" << std::endl;
}

void test_bad_magic() {
    std::cout << "Running test_bad_magic..." << std::endl;
    grid::GridTensor t0 = ramp(2, 2, 1);
    grid::GridTensor t1 = t0;
    t1.at(0, 0, 0) = 1.0f;
    std::string log = DeltaEncoder::serialize(DeltaEncoder::encode(t0, t1, 1));
    log[1] = 'X';

    DeltaLogReader reader(log, true);
    DeltaRecord r;
    assert(throwsType<core::CorruptionError>([&]() { reader.next(r); }));
    std::cout << "PASSED" << std::endl;
}

int main() {
    test_identical_tensors_have_empty_delta();
    test_single_change_addressed();
    test_signed_zero_is_a_change();
    test_apply_reproduces_next();
    test_shape_mismatch_rejected();
    test_apply_out_of_range();
    test_reader_walks_frames();
    test_partial_tail();
    test_reader_outlives_source_buffer();
    test_bad_magic();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
