#include <odds_chart/core/hover_tooltip.h>
#include <odds_chart/core/constants.h>
#include "utf8_utils.h"

#include <algorithm>
#include <utility>

namespace odds::chart {

namespace c = constants;

double tooltip_width_for_length(std::size_t text_length) noexcept
{
    const double natural = static_cast<double>(text_length) * c::k_tooltip_char_width + c::k_tooltip_padding;
    return std::max(c::k_tooltip_min_width, std::min(c::k_tooltip_max_width, natural));
}

hover_time_box_t place_hover_time_box(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double hover_x,
    std::string text)
{
    const double anchor_x = std::max(
        viewport.left + c::k_tooltip_anchor_inset,
        std::min(viewport.right - c::k_tooltip_anchor_inset, hover_x));

    hover_time_box_t box;
    box.width  = tooltip_width_for_length(detail::utf16_length(text));
    box.height = c::k_tooltip_height;
    // Left edge wins when the plot is narrower than the box.
    box.x = std::max(
        viewport.left + c::k_tooltip_edge_inset,
        std::min(viewport.right - box.width - c::k_tooltip_edge_inset, anchor_x - box.width / 2.0));
    box.y         = viewport.top + c::k_tooltip_top_inset;
    box.text_x    = box.x + box.width / 2.0;
    box.text_y    = box.y + box.height / 2.0 + c::k_tooltip_baseline;
    box.font_size    = metrics.hover_time_font;
    box.stroke_width = metrics.hover_time_stroke_width;
    box.text         = std::move(text);
    return box;
}

} // namespace odds::chart
