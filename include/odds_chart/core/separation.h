#pragma once

// odds_chart - Curve Mapping & Separation
// Probability -> plot y, and the minimum-gap rule that keeps the Yes and No
// curves apart. The rule is three ordered steps; each step is exposed on its
// own so the invariants can be checked in isolation.

#include "types.h"

namespace odds::chart {

/// y of a probability; 1.0 maps to the top edge, 0.0 to the bottom edge.
[[nodiscard]] double y_from_probability(const plot_viewport_t& viewport, double probability) noexcept;

/// Step 1: widen the pair symmetrically around its midpoint to exactly min_gap
/// when it is closer than that. Pairs already apart are returned unchanged.
[[nodiscard]] separated_pair_t enforce_min_gap(separated_pair_t pair, double min_gap) noexcept;

/// Step 2: shift both down when the Yes curve rises above min_y.
[[nodiscard]] separated_pair_t clamp_pair_top(separated_pair_t pair, double min_y) noexcept;

/// Step 3: shift both up when the No curve drops below max_y.
[[nodiscard]] separated_pair_t clamp_pair_bottom(separated_pair_t pair, double max_y) noexcept;

/// Steps 1-3 with the standard gap and edge insets.
[[nodiscard]] separated_pair_t separate_series_y(
    const plot_viewport_t& viewport,
    double yes_y_raw,
    double no_y_raw) noexcept;

/// Yes at y(p), No at y(1 - p), then separated.
[[nodiscard]] separated_pair_t separated_for_probability(
    const plot_viewport_t& viewport,
    double yes_probability) noexcept;

} // namespace odds::chart
