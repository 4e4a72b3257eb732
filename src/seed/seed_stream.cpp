#include "seed_stream.h"
#include "../core/errors.h"
#include <cmath>

namespace seed {

namespace {

inline uint64_t rotl64(uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
}

inline uint64_t splitmix64(uint64_t& x) {
    x += 0x9E3779B97F4A7C15ull;
    uint64_t z = x;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
}

const char* const kSubsystems[] = {
    SeedStreamSet::HYDROLOGY,
    SeedStreamSet::TEMPERATURE,
    SeedStreamSet::VEGETATION,
    SeedStreamSet::NOISE
};

} // namespace

uint64_t fnv1a64(const void* data, size_t n, uint64_t h) {
    constexpr uint64_t prime = 1099511628211ull;
    const unsigned char* p = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < n; ++i) {
        h ^= static_cast<uint64_t>(p[i]);
        h *= prime;
    }
    return h;
}

uint64_t fnv1a64(std::string_view text) {
    return fnv1a64(text.data(), text.size());
}

SeedStream::SeedStream(uint64_t seedValue) {
    uint64_t x = seedValue;
    for (auto& s : state_) s = splitmix64(x);
    if ((state_[0] | state_[1] | state_[2] | state_[3]) == 0ull) state_[0] = 1;
}

uint64_t SeedStream::nextU64() {
    const uint64_t result = rotl64(state_[1] * 5ull, 7) * 9ull;
    const uint64_t t = state_[1] << 17;
    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];
    state_[2] ^= t;
    state_[3] = rotl64(state_[3], 45);
    return result;
}

double SeedStream::nextDouble01() {
    return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
}

float SeedStream::nextFloat01() {
    return static_cast<float>(static_cast<double>(nextU64() >> 40) * (1.0 / 16777216.0));
}

uint32_t SeedStream::nextBelow(uint32_t bound) {
    // Lemire's multiply-shift with rejection; unbiased.
    uint64_t m = static_cast<uint64_t>(nextU32()) * bound;
    uint32_t low = static_cast<uint32_t>(m);
    if (low < bound) {
        const uint32_t threshold = static_cast<uint32_t>(-bound) % bound;
        while (low < threshold) {
            m = static_cast<uint64_t>(nextU32()) * bound;
            low = static_cast<uint32_t>(m);
        }
    }
    return static_cast<uint32_t>(m >> 32);
}

double SeedStream::nextGaussian() {
    if (hasSpare_) {
        hasSpare_ = false;
        return spare_;
    }
    double u1 = nextDouble01();
    while (u1 <= 0.0) u1 = nextDouble01();
    const double u2 = nextDouble01();
    const double r = std::sqrt(-2.0 * std::log(u1));
    const double theta = 6.283185307179586476925286766559 * u2;
    spare_ = r * std::sin(theta);
    hasSpare_ = true;
    return r * std::cos(theta);
}

SeedStream derive(uint64_t masterSeed, std::string_view subsystem, uint64_t salt) {
    uint64_t x = masterSeed ^ rotl64(fnv1a64(subsystem), 17) ^ salt;
    return SeedStream(splitmix64(x));
}

SeedStreamSet::SeedStreamSet(uint64_t masterSeed, std::map<std::string, uint64_t> salts)
    : masterSeed_(masterSeed), salts_(std::move(salts)) {
    for (const auto& kv : salts_) {
        bool known = false;
        for (const char* name : kSubsystems) {
            if (kv.first == name) known = true;
        }
        if (!known) {
            throw core::ConfigError("salt given for unknown seed stream '" + kv.first + "'");
        }
    }
}

SeedStream SeedStreamSet::claim(const std::string& subsystem) {
    bool known = false;
    for (const char* name : kSubsystems) {
        if (subsystem == name) known = true;
    }
    if (!known) {
        throw core::ConfigError("unknown seed stream '" + subsystem + "'");
    }
    if (!claimed_.insert(subsystem).second) {
        throw core::ConfigError("seed stream '" + subsystem + "' already claimed");
    }
    auto it = salts_.find(subsystem);
    const uint64_t salt = (it != salts_.end()) ? it->second : 0;
    return derive(masterSeed_, subsystem, salt);
}

} // namespace seed
