#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace seed {

constexpr uint64_t FNV1A64_OFFSET = 14695981039346656037ull;

// FNV-1a 64 over raw bytes. Pass a previous digest as h to continue it.
uint64_t fnv1a64(const void* data, size_t n, uint64_t h = FNV1A64_OFFSET);
uint64_t fnv1a64(std::string_view text);

/**
 * @brief Independent pseudo-random sequence owned by exactly one subsystem.
 *
 * xoshiro256** core seeded through splitmix64. All derived draws are
 * computed explicitly so the sequence never depends on the standard
 * library's distribution implementations.
 */
class SeedStream {
public:
    explicit SeedStream(uint64_t seedValue = 0);

    uint64_t nextU64();
    uint32_t nextU32() { return static_cast<uint32_t>(nextU64() >> 32); }

    // [0, 1)
    double nextDouble01();
    float nextFloat01();

    // [lo, hi)
    float uniform(float lo, float hi) { return lo + (hi - lo) * nextFloat01(); }

    // Uniform integer in [0, bound). bound must be > 0.
    uint32_t nextBelow(uint32_t bound);

    // Standard normal via Box-Muller (double precision internally).
    double nextGaussian();

    // Snapshot for comparisons in tests / manifests.
    std::array<uint64_t, 4> state() const { return state_; }

private:
    std::array<uint64_t, 4> state_;
    bool hasSpare_ = false;
    double spare_ = 0.0;
};

/**
 * @brief Pure derivation: same (master, name, salt) always yields the same stream.
 *
 * The name is mixed into the seed, not used to slice a shared sequence.
 */
SeedStream derive(uint64_t masterSeed, std::string_view subsystem, uint64_t salt = 0);

/**
 * @brief The per-run partition of the master seed.
 *
 * Each subsystem claims its own stream exactly once; there is no ambient
 * generator and no way to reach another subsystem's stream.
 */
class SeedStreamSet {
public:
    static constexpr const char* HYDROLOGY = "hydrology";
    static constexpr const char* TEMPERATURE = "temperature";
    static constexpr const char* VEGETATION = "vegetation";
    static constexpr const char* NOISE = "noise";

    SeedStreamSet(uint64_t masterSeed, std::map<std::string, uint64_t> salts = {});

    // Throws core::ConfigError for unknown names or a second claim.
    SeedStream claim(const std::string& subsystem);

    bool claimed(const std::string& subsystem) const { return claimed_.count(subsystem) > 0; }
    uint64_t masterSeed() const { return masterSeed_; }

private:
    uint64_t masterSeed_;
    std::map<std::string, uint64_t> salts_;
    std::set<std::string> claimed_;
};

} // namespace seed
