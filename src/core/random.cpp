/// @file random.cpp
/// @brief Random source implementation for mcv_core

#include <mcvillage/core/random.hpp>

#include <cmath>

namespace mcv_core {

// =============================================================================
// IRandomSource
// =============================================================================

int IRandomSource::range_int(int min, int max_exclusive) {
    float t = value();
    if (max_exclusive <= min) {
        return min;
    }
    const auto span = static_cast<std::int64_t>(max_exclusive) - min;
    auto offset = static_cast<std::int64_t>(std::floor(static_cast<double>(t) * static_cast<double>(span)));
    if (offset >= span) {
        offset = span - 1;
    }
    return static_cast<int>(min + offset);
}

// =============================================================================
// SeededRandom
// =============================================================================

SeededRandom::SeededRandom() {
    reseed_from_entropy();
}

SeededRandom::SeededRandom(std::uint32_t seed) {
    reseed(seed);
}

float SeededRandom::value() {
    ++m_draws;
    // 24 high bits fill a float mantissa exactly, so the result stays below 1
    return static_cast<float>(m_rng() >> 8) * (1.0f / 16777216.0f);
}

void SeededRandom::reseed(std::uint32_t seed) {
    m_seed = seed;
    m_rng.seed(seed);
    m_draws = 0;
}

void SeededRandom::reseed_from_entropy() {
    reseed(std::random_device{}());
}

// =============================================================================
// Seed Streams
// =============================================================================

std::uint32_t derive_seed(std::uint32_t base, std::uint32_t stream) noexcept {
    // splitmix64 finalizer over (base, stream)
    std::uint64_t z = (static_cast<std::uint64_t>(base) << 32) | stream;
    z += 0x9E3779B97F4A7C15ull;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    z ^= z >> 31;
    return static_cast<std::uint32_t>(z ^ (z >> 32));
}

} // namespace mcv_core
