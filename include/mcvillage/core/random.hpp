#pragma once

/// @file random.hpp
/// @brief Seedable random sources for mcv_core
///
/// All randomized behaviour in mcvillage draws through IRandomSource so that a
/// fixed seed reproduces a generation bit for bit. SeededRandom derives floats
/// from the raw std::mt19937 output instead of std::uniform_real_distribution,
/// whose algorithm differs between standard library vendors.

#include "fwd.hpp"

#include <cstdint>
#include <random>

namespace mcv_core {

// =============================================================================
// IRandomSource
// =============================================================================

/// Interface for uniform random draws
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform value in [0, 1)
    [[nodiscard]] virtual float value() = 0;

    /// Uniform value between min and max. Always consumes exactly one draw,
    /// so reversed or empty ranges keep the stream aligned.
    [[nodiscard]] virtual float range(float min, float max) {
        float t = value();
        return min + (max - min) * t;
    }

    /// Uniform integer in [min, max_exclusive). Consumes one draw; returns min
    /// when the range is empty.
    [[nodiscard]] virtual int range_int(int min, int max_exclusive);

    /// Restart the stream from a fixed seed
    virtual void reseed(std::uint32_t seed) = 0;

    /// Restart the stream from a non-deterministic seed
    virtual void reseed_from_entropy() = 0;
};

// =============================================================================
// SeededRandom
// =============================================================================

/// Mersenne twister backed random source
class SeededRandom : public IRandomSource {
public:
    /// Seeds from entropy
    SeededRandom();

    explicit SeededRandom(std::uint32_t seed);

    [[nodiscard]] float value() override;

    void reseed(std::uint32_t seed) override;
    void reseed_from_entropy() override;

    /// Seed last applied (entropy seeds included)
    [[nodiscard]] std::uint32_t seed() const noexcept { return m_seed; }

    /// Number of draws since the last reseed
    [[nodiscard]] std::uint64_t draw_count() const noexcept { return m_draws; }

private:
    std::mt19937 m_rng;
    std::uint32_t m_seed = 0;
    std::uint64_t m_draws = 0;
};

// =============================================================================
// Seed Streams
// =============================================================================

/// Seed for an independent stream `stream` under a shared base seed.
/// Components that reseed their own source (a fixed-seed generator reseeds
/// from entropy when done) each get a derived seed so one cannot perturb
/// another's draws.
[[nodiscard]] std::uint32_t derive_seed(std::uint32_t base, std::uint32_t stream) noexcept;

} // namespace mcv_core
