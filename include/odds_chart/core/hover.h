#pragma once

// odds_chart - Hover Resolution
// Maps a cursor x to a continuous position in the display series and
// interpolates the hovered probability.

#include "types.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace odds::chart {

/// x of display index j out of n; a single point sits at the right edge.
[[nodiscard]] double x_for_index(const plot_viewport_t& viewport, std::size_t j, std::size_t n) noexcept;

/// Fraction of the plot span under x, clamped to [0, 1]; 1 for a zero span.
[[nodiscard]] double hover_fraction(const plot_viewport_t& viewport, double x) noexcept;

/// Resolve the hover sample. Without a cursor the rightmost point is used.
/// Requires a non-empty series.
[[nodiscard]] hover_sample_t resolve_hover(
    const std::vector<double>& display_series,
    const plot_viewport_t& viewport,
    std::optional<double> hover_x);

} // namespace odds::chart
