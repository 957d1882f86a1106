#pragma once
// odds_chart - Chart Layout Engine
// Converts a display series, a plot viewport and an optional hover cursor
// into curve coordinates, readouts, decorations and the hover tooltip.
// This is pure computational logic with no rendering dependencies.

#include "types.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace odds::chart {

class Profiler;

/// Plot frame for an aspect ratio (clamped to [1.2, 8]) and variant.
[[nodiscard]] plot_viewport_t make_plot_viewport(double chart_aspect, Chart_variant variant) noexcept;

/// Dashed guides at 0/25/50/75/100 %.
[[nodiscard]] std::vector<guide_line_t> build_guide_lines(const plot_viewport_t& viewport);

// -----------------------------------------------------------------------------
// Chart Layout Engine
// -----------------------------------------------------------------------------
// Stateless - all inputs provided via parameters struct.
class Chart_layout_engine
{
public:
    // All inputs for a layout pass
    struct parameters_t
    {
        const std::vector<double>* display_series = nullptr;
        plot_viewport_t            viewport;
        Chart_variant              variant = Chart_variant::DETAIL;

        // Cursor in plot units; nullopt when the pointer is not over this chart
        std::optional<double> hover_x;

        // Market state
        bool   is_live             = false;
        double current_probability = 0.5;

        // Hover tooltip text source; the tooltip is omitted without it
        std::optional<time_window_t>       window;
        std::function<std::string(double)> format_hover_time;

        // Optional profiler (from Chart_config)
        Profiler* profiler = nullptr;

        // Optional error sink (from Chart_config)
        std::function<void(const std::string&)> log_error;
    };

    Chart_layout_engine() = default;

    // Main entry point - calculate geometry from parameters
    chart_geometry_t layout(const parameters_t& params) const;

    // Series-only form; the current price is taken from the last point and
    // no tooltip is produced.
    chart_geometry_t layout(
        const std::vector<double>& display_series,
        const plot_viewport_t& viewport,
        std::optional<double> hover_x,
        Chart_variant variant) const;

private:
    std::vector<skip_zone_t> build_skip_zones(const chart_geometry_t& geometry) const;
};

} // namespace odds::chart
