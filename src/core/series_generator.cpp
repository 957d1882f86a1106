#include <odds_chart/core/series_generator.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/constants.h>
#include <odds_chart/core/lcg_random.h>
#include "utf8_utils.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace odds::chart {

using namespace detail;
namespace c = constants;

namespace {

constexpr double k_two_pi = 6.283185307179586476925286766559;

} // anonymous namespace

std::uint32_t Series_generator::derive_seed(std::string_view market_id) noexcept
{
    return static_cast<std::uint32_t>(utf16_unit_sum(market_id) % c::k_seed_modulus);
}

int Series_generator::trend_sign_for_seed(std::uint32_t seed) noexcept
{
    return (seed % 2 == 0) ? 1 : -1;
}

double Series_generator::historical_bias_for_seed(std::uint32_t seed) noexcept
{
    return (0.2 + static_cast<double>(seed % 5) * 0.02) * trend_sign_for_seed(seed);
}

double Series_generator::transition_weight(double t) noexcept
{
    if (t <= c::k_transition_start) {
        return 0.0;
    }
    const double u = (t - c::k_transition_start) / (1.0 - c::k_transition_start);
    return smoothstep_unit(u);
}

Step_kind Series_generator::step_kind_for_index(int index) noexcept
{
    if (index == 0) {
        return Step_kind::ANCHOR;
    }
    return (index % c::k_real_step_every == 0) ? Step_kind::REAL_STEP : Step_kind::JITTER_STEP;
}

double Series_generator::anchor_at(
    double t,
    double historical_center,
    double current_probability,
    std::uint32_t seed) noexcept
{
    const double macro_anchor = lerp(historical_center, current_probability, transition_weight(t));
    const double amplitude = (t > c::k_micro_wave_late_t)
        ? c::k_micro_wave_late_amp
        : c::k_micro_wave_early_amp;
    const double micro_wave =
        std::sin((t * c::k_micro_wave_cycles + seed * c::k_micro_wave_phase) * k_two_pi) * amplitude;
    return clamp_probability(macro_anchor + micro_wave);
}

double Series_generator::next_value(
    int index,
    double prev,
    double anchor,
    Lcg_random& rng)
{
    // Draw order matters for reproducibility: jump, step noise, then jitter.
    // The candidate is drawn even when the jitter step discards it.
    const double jump = (index % c::k_jump_every == 0)
        ? rng.next_centered(c::k_jump_amp)
        : 0.0;
    const double drift_pull = (anchor - prev) * c::k_drift_pull;
    const double step_noise = (index % c::k_coarse_noise_every == 0)
        ? rng.next_centered(c::k_coarse_noise_amp)
        : rng.next_centered(c::k_fine_noise_amp);
    const double candidate = prev + jump + drift_pull + step_noise;

    switch (step_kind_for_index(index)) {
        case Step_kind::REAL_STEP:
            return clamp_probability(candidate);
        case Step_kind::JITTER_STEP:
            return clamp_probability(prev + rng.next_centered(c::k_jitter_amp));
        case Step_kind::ANCHOR:
            break;
    }
    return clamp_probability(anchor);
}

std::vector<double> Series_generator::build_base_series(
    std::uint32_t seed,
    double current_probability)
{
    const int count = c::k_base_series_count;
    const double historical_center =
        clamp_probability(current_probability + historical_bias_for_seed(seed));

    Lcg_random rng(seed);
    std::vector<double> series;
    series.reserve(static_cast<std::size_t>(count));

    for (int idx = 0; idx < count; ++idx) {
        const double t = static_cast<double>(idx) / static_cast<double>(count - 1);
        const double anchor = anchor_at(t, historical_center, current_probability, seed);

        if (step_kind_for_index(idx) == Step_kind::ANCHOR) {
            series.push_back(anchor);
            continue;
        }
        series.push_back(next_value(idx, series.back(), anchor, rng));
    }

    series.back() = current_probability;
    return series;
}

std::vector<double> Series_generator::resample_window(
    const std::vector<double>& base_series,
    double window_start,
    int point_count,
    double current_probability)
{
    std::vector<double> out;
    if (point_count <= 0 || base_series.empty()) {
        return out;
    }

    const auto n = static_cast<std::size_t>(point_count);
    const double last_index = static_cast<double>(base_series.size() - 1);
    out.reserve(n);

    for (std::size_t j = 0; j < n; ++j) {
        const double local_t = index_fraction(j, n);
        const double base_t = window_start + local_t * (1.0 - window_start);
        out.push_back(sample_at_position(base_series, base_t * last_index));
    }

    out.back() = current_probability;
    return out;
}

generated_series_t Series_generator::generate(
    std::string_view market_id,
    double current_probability,
    Time_scale scale) const
{
    const time_scale_spec_t spec = time_scale_spec(scale);

    generated_series_t result;
    result.seed              = derive_seed(market_id);
    result.trend_sign        = trend_sign_for_seed(result.seed);
    result.historical_bias   = historical_bias_for_seed(result.seed);
    result.historical_center = clamp_probability(current_probability + result.historical_bias);
    result.window_hours      = spec.window_hours;
    result.point_count       = spec.display_point_count;
    result.window_start      = std::max(0.0,
        1.0 - static_cast<double>(spec.window_hours) / static_cast<double>(c::k_total_hours));
    result.window_end        = 1.0;

    result.base_series    = build_base_series(result.seed, current_probability);
    result.display_series = resample_window(
        result.base_series, result.window_start, result.point_count, current_probability);
    return result;
}

} // namespace odds::chart
