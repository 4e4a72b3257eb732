#include <iostream>
#include <cassert>
#include <cstdint>
#include "../src/core/errors.h"
#include "../src/seed/seed_stream.h"

using namespace seed;

template <typename E, typename Fn>
static bool throwsType(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_fnv_reference() {
    std::cout << "Running test_fnv_reference..." << std::endl;
    assert(fnv1a64("") == 0xcbf29ce484222325ull);
    assert(fnv1a64("a") == 0xaf63dc4c8601ec8cull);
    std::cout << "PASSED" << std::endl;
}

void test_derive_is_pure() {
    std::cout << "Running test_derive_is_pure..." << std::endl;
    SeedStream a = derive(42, "temperature");
    SeedStream b = derive(42, "temperature");
    for (int i = 0; i < 1000; ++i) {
        assert(a.nextU64() == b.nextU64());
    }
    std::cout << "PASSED" << std::endl;
}

void test_names_are_mixed_in() {
    std::cout << "Running test_names_are_mixed_in..." << std::endl;
    SeedStream a = derive(42, "temperature");
    SeedStream b = derive(42, "hydrology");
    int equal = 0;
    for (int i = 0; i < 256; ++i) {
        if (a.nextU64() == b.nextU64()) equal++;
    }
    assert(equal == 0);

    // Different master seed, same name
    SeedStream c = derive(43, "temperature");
    SeedStream d = derive(42, "temperature");
    assert(c.nextU64() != d.nextU64());
    std::cout << "PASSED" << std::endl;
}

void test_draw_ranges() {
    std::cout << "Running test_draw_ranges..." << std::endl;
    SeedStream s = derive(7, "noise");
    double sum = 0.0;
    for (int i = 0; i < 10000; ++i) {
        float f = s.nextFloat01();
        assert(f >= 0.0f && f < 1.0f);
        double d = s.nextDouble01();
        assert(d >= 0.0 && d < 1.0);
        assert(s.nextBelow(13) < 13u);
        float u = s.uniform(-1.0f, 1.0f);
        assert(u >= -1.0f && u < 1.0f);
        sum += d;
    }
    double mean = sum / 10000.0;
    assert(mean > 0.45 && mean < 0.55);
    std::cout << "PASSED" << std::endl;
}

void test_streams_do_not_interfere() {
    std::cout << "Running test_streams_do_not_interfere..." << std::endl;
    SeedStreamSet busy(42);
    SeedStream hydro = busy.claim(SeedStreamSet::HYDROLOGY);
    for (int i = 0; i < 5000; ++i) hydro.nextU64();
    SeedStream tempAfterDraws = busy.claim(SeedStreamSet::TEMPERATURE);

    SeedStreamSet idle(42);
    SeedStream tempFresh = idle.claim(SeedStreamSet::TEMPERATURE);

    for (int i = 0; i < 100; ++i) {
        assert(tempAfterDraws.nextU64() == tempFresh.nextU64());
    }
    std::cout << "PASSED" << std::endl;
}

void test_claims_are_exclusive() {
    std::cout << "Running test_claims_are_exclusive..." << std::endl;
    SeedStreamSet set(1);
    set.claim(SeedStreamSet::VEGETATION);
    assert(set.claimed(SeedStreamSet::VEGETATION));
    assert(!set.claimed(SeedStreamSet::NOISE));
    assert(throwsType<core::ConfigError>([&] { set.claim(SeedStreamSet::VEGETATION); }));
    assert(throwsType<core::ConfigError>([&] { set.claim("weather"); }));
    assert(throwsType<core::ConfigError>([] { SeedStreamSet bad(1, {{"weather", 3}}); }));
    std::cout << "PASSED" << std::endl;
}

void test_salt_perturbs_one_stream() {
    std::cout << "Running test_salt_perturbs_one_stream..." << std::endl;
    SeedStreamSet plain(42);
    SeedStreamSet salted(42, {{SeedStreamSet::HYDROLOGY, 99}});

    assert(plain.claim(SeedStreamSet::HYDROLOGY).nextU64() != salted.claim(SeedStreamSet::HYDROLOGY).nextU64());
    assert(plain.claim(SeedStreamSet::TEMPERATURE).state() == salted.claim(SeedStreamSet::TEMPERATURE).state());
    assert(plain.claim(SeedStreamSet::VEGETATION).state() == salted.claim(SeedStreamSet::VEGETATION).state());
    assert(plain.claim(SeedStreamSet::NOISE).state() == salted.claim(SeedStreamSet::NOISE).state());
    std::cout << "PASSED" << std::endl;
}

int main() {
    test_fnv_reference();
    test_derive_is_pure();
    test_names_are_mixed_in();
    test_draw_ranges();
    test_streams_do_not_interfere();
    test_claims_are_exclusive();
    test_salt_perturbs_one_stream();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
