#pragma once

// odds_chart - Hover Time Tooltip
// Sizes and positions the time box shown at the top of the plot while
// hovering.

#include "types.h"
#include "variant_metrics.h"

#include <cstddef>
#include <string>

namespace odds::chart {

/// Box width for a text of the given length (UTF-16 units), in [70, 178].
[[nodiscard]] double tooltip_width_for_length(std::size_t text_length) noexcept;

/// Lay out the tooltip for text centred on hover_x.
[[nodiscard]] hover_time_box_t place_hover_time_box(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double hover_x,
    std::string text);

} // namespace odds::chart
