#pragma once

// odds_chart - Synthetic Series Generator
// Fabricates a reproducible 24h probability history that ends exactly at
// the market's current price, and resamples the window shown for a scale.
// Pure computational logic; the same (market id, price, scale) always
// yields bit-identical output.

#include "types.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace odds::chart {

class Lcg_random;

/// Output of one generation pass.
struct generated_series_t
{
    std::vector<double> base_series;      ///< 289 points, 5 minute resolution over 24h
    std::vector<double> display_series;   ///< Resampled trailing window

    double window_start = 0.0;            ///< Fraction of the 24h horizon
    double window_end   = 1.0;

    int window_hours = 24;
    int point_count  = 0;

    std::uint32_t seed              = 0;
    int           trend_sign        = 1;
    double        historical_bias   = 0.0;
    double        historical_center = 0.0;
};

/// How a base-series index moves away from its predecessor.
enum class Step_kind
{
    ANCHOR,       ///< First index: take the anchor as is
    REAL_STEP,    ///< Drift + noise + occasional jump
    JITTER_STEP   ///< Tiny jitter around the previous value
};

class Series_generator
{
public:
    Series_generator() = default;

    /// Main entry point.
    generated_series_t generate(
        std::string_view market_id,
        double current_probability,
        Time_scale scale) const;

    // --- Building blocks, exposed for testing ---

    /// Sum of the id's UTF-16 code units modulo 97.
    static std::uint32_t derive_seed(std::string_view market_id) noexcept;
    static int trend_sign_for_seed(std::uint32_t seed) noexcept;
    static double historical_bias_for_seed(std::uint32_t seed) noexcept;

    /// Blend weight from the historical centre to the current price at t in [0, 1].
    static double transition_weight(double t) noexcept;

    static Step_kind step_kind_for_index(int index) noexcept;

    /// Anchor the walk is pulled toward at t.
    static double anchor_at(double t, double historical_center,
        double current_probability, std::uint32_t seed) noexcept;

    static std::vector<double> build_base_series(
        std::uint32_t seed, double current_probability);

    /// Resample the trailing part of the base series starting at window_start.
    static std::vector<double> resample_window(
        const std::vector<double>& base_series,
        double window_start,
        int point_count,
        double current_probability);

private:
    static double next_value(
        int index,
        double prev,
        double anchor,
        Lcg_random& rng);
};

} // namespace odds::chart
