#pragma once
#include <cstdint>
#include <limits>

// SplitMix64 step. Used to spread a raw seed over the full state so that
// small seeds (e.g. 1430) still produce well mixed streams.
constexpr uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// Every random decision of a generation is drawn from one instance, in a fixed
// order. Pass it by reference; never copy it into a second consumer.
struct RNG {
    uint64_t state;

    explicit RNG(uint64_t seed = 0) : state(splitmix64(seed)) {
        if (state == 0) state = 0x2545f4914f6cdd1dull;
    }

    uint64_t nextU64() {
        // xorshift64*
        uint64_t x = state;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        state = x;
        return x * 0x2545f4914f6cdd1dull;
    }

    // Inclusive on both ends.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(hiInclusive) - lo + 1);
        return lo + static_cast<int>(nextU64() % span);
    }

    double next01() {
        // [0,1) with 53 bits of precision.
        return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
    }

    bool chance(double p) {
        return next01() < p;
    }
};
