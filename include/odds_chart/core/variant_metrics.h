#pragma once

// odds_chart - Variant Metrics
// Per-variant sizes for the home (compact) and detail charts.

#include "types.h"

namespace odds::chart {

struct variant_metrics_t
{
    double axis_gutter;
    double readout_rail;

    double readout_hover_offset;
    double readout_rest_offset;
    double readout_label_font;
    double readout_pct_font;
    double readout_line_gap;
    double readout_stroke_width;

    double hover_time_font;
    double hover_time_stroke_width;

    [[nodiscard]] constexpr double readout_block_height() const noexcept
    {
        return readout_label_font + readout_line_gap + readout_pct_font;
    }
};

constexpr variant_metrics_t k_home_metrics{
    22.0, 18.0,
    8.0, 6.2, 4.8, 9.6, 0.86, 0.24,
    7.8, 0.16
};

constexpr variant_metrics_t k_detail_metrics{
    24.0, 22.0,
    9.0, 6.8, 5.2, 10.4, 0.95, 0.28,
    8.4, 0.2
};

[[nodiscard]] constexpr const variant_metrics_t& metrics_for(Chart_variant variant) noexcept
{
    return variant == Chart_variant::HOME ? k_home_metrics : k_detail_metrics;
}

} // namespace odds::chart
