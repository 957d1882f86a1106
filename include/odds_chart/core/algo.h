#pragma once

// odds_chart - Algorithm Utilities
// Small, header-only helpers shared by the generator and the layout engine.
// Pure C++ with no framework dependencies.
//
// Public API (odds::chart):
//   - format_fixed: Fixed-precision formatting for coordinates and labels
//   - round_percent: Probability -> whole percent
//   - format_volume_label: Trading volume footer text
//
// Internal API (odds::chart::detail):
//   - Clamping and interpolation helpers
//   - Fractional index sampling

#include "constants.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace odds::chart {

// =============================================================================
// Public API
// =============================================================================

// Format a value with a fixed number of decimals, collapsing "-0.000" to "0.000".
inline std::string format_fixed(double v, int digits)
{
    const double scale = std::pow(10.0, double(std::max(0, digits)));
    double r = std::round(v * scale) / scale;
    if (std::abs(r) < 0.5 / scale) {
        r = 0.0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(std::max(0, digits)) << r;
    return oss.str();
}

// Whole percent with half-up rounding.
inline int round_percent(double probability)
{
    return static_cast<int>(std::floor(probability * 100.0 + 0.5));
}

// Grouped volume with " BTC vol": two decimals below 1 BTC, one or two above.
inline std::string format_volume_label(double volume_btc)
{
    if (!std::isfinite(volume_btc)) {
        volume_btc = 0.0;
    }

    std::string digits = format_fixed(volume_btc, 2);
    if (volume_btc >= 1.0 && digits.back() == '0') {
        digits.pop_back();
    }

    const std::size_t sign = (digits.front() == '-') ? 1 : 0;
    const std::size_t dot  = digits.find('.');
    const std::string whole = digits.substr(sign, dot - sign);

    std::string out = digits.substr(0, sign);
    for (std::size_t i = 0; i < whole.size(); ++i) {
        if (i > 0 && (whole.size() - i) % 3 == 0) {
            out += ',';
        }
        out += whole[i];
    }
    out += digits.substr(dot);
    return out + " BTC vol";
}

// =============================================================================
// Internal Implementation Details
// =============================================================================

namespace detail {

inline double clamp_probability(double v)
{
    return std::max(constants::k_probability_min, std::min(constants::k_probability_max, v));
}

inline double clamp_unit(double v)
{
    return std::max(0.0, std::min(1.0, v));
}

inline double lerp(double a, double b, double t)
{
    return a + (b - a) * t;
}

// Cubic smoothstep on an already normalised parameter.
inline double smoothstep_unit(double u)
{
    return u * u * (3.0 - 2.0 * u);
}

// Fraction of an n-point series for index j; a single point sits at the right edge.
inline double index_fraction(std::size_t j, std::size_t n)
{
    if (n <= 1) {
        return 1.0;
    }
    return static_cast<double>(j) / static_cast<double>(n - 1);
}

// Linear interpolation at a fractional index.
// The bracketing indices are clamped to the series, so positions outside
// [0, n-1] return the nearest endpoint. Requires a non-empty series.
inline double sample_at_position(const std::vector<double>& values, double position)
{
    const double last = static_cast<double>(values.size() - 1);
    const double left  = std::max(0.0, std::min(last, std::floor(position)));
    const double right = std::max(left, std::min(last, std::ceil(position)));
    const double mix   = clamp_unit(position - left);

    const double v_left  = values[static_cast<std::size_t>(left)];
    const double v_right = values[static_cast<std::size_t>(right)];
    return v_left + (v_right - v_left) * mix;
}

} // namespace detail

} // namespace odds::chart
