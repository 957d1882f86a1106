#pragma once

// odds_chart - Linear Congruential Generator
// Tiny reproducible PRNG for synthetic series. Each generator is a value
// owned by one generation pass; there is no shared state.

#include <cstdint>

namespace odds::chart {

/// 32-bit LCG (Numerical Recipes constants) with a scrambled seed.
///
/// state_0   = seed * 1103515245 + 12345
/// state_k+1 = (state_k * 1664525 + 1013904223) mod 2^32
/// draw      = state_k+1 / (2^32 - 1)
class Lcg_random
{
public:
    static constexpr std::uint64_t k_seed_multiplier = 1103515245u;
    static constexpr std::uint64_t k_seed_increment  = 12345u;
    static constexpr std::uint64_t k_multiplier      = 1664525u;
    static constexpr std::uint64_t k_increment       = 1013904223u;
    static constexpr std::uint64_t k_modulus_mask    = 0xFFFFFFFFu;
    static constexpr double        k_divisor         = 4294967295.0;

    explicit Lcg_random(std::uint32_t seed) noexcept
    :
        m_state(static_cast<std::uint64_t>(seed) * k_seed_multiplier + k_seed_increment)
    {}

    /// Next draw in [0, 1].
    double next() noexcept
    {
        // The initial state can exceed 32 bits; the product still fits in 64.
        m_state = (m_state * k_multiplier + k_increment) & k_modulus_mask;
        return static_cast<double>(m_state) / k_divisor;
    }

    /// Next draw centred on zero, scaled to [-amplitude/2, amplitude/2].
    double next_centered(double amplitude) noexcept
    {
        return (next() - 0.5) * amplitude;
    }

    std::uint64_t state() const noexcept { return m_state; }

private:
    std::uint64_t m_state;
};

} // namespace odds::chart
