#include <odds_chart/core/chart_layout.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/chart_config.h>
#include <odds_chart/core/constants.h>
#include <odds_chart/core/decoration_trail.h>
#include <odds_chart/core/hover.h>
#include <odds_chart/core/hover_tooltip.h>
#include <odds_chart/core/readout_layout.h>
#include <odds_chart/core/separation.h>
#include <odds_chart/core/time_axis.h>
#include <odds_chart/core/variant_metrics.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>

namespace odds::chart {

namespace c = constants;

namespace {

constexpr std::array<int, 5> k_guide_levels{0, 25, 50, 75, 100};
constexpr const char*        k_hover_time_suffix = " ET";

} // anonymous namespace

plot_viewport_t make_plot_viewport(double chart_aspect, Chart_variant variant) noexcept
{
    const variant_metrics_t& metrics = metrics_for(variant);
    const double aspect = std::max(c::k_aspect_min, std::min(c::k_aspect_max, chart_aspect));

    plot_viewport_t viewport;
    viewport.height       = c::k_chart_height;
    viewport.width        = std::round(c::k_chart_height * aspect);
    viewport.axis_gutter  = metrics.axis_gutter;
    viewport.readout_rail = metrics.readout_rail;
    viewport.left         = c::k_plot_left;
    viewport.right        = viewport.width - metrics.axis_gutter - metrics.readout_rail;
    viewport.top          = c::k_plot_inset_y;
    viewport.bottom       = c::k_chart_height - c::k_plot_inset_y;
    return viewport;
}

std::vector<guide_line_t> build_guide_lines(const plot_viewport_t& viewport)
{
    std::vector<guide_line_t> lines;
    lines.reserve(k_guide_levels.size());
    for (const int level : k_guide_levels) {
        guide_line_t line;
        line.level_pct = level;
        line.y         = y_from_probability(viewport, level / 100.0);
        line.text      = std::to_string(level) + "%";
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<skip_zone_t> Chart_layout_engine::build_skip_zones(const chart_geometry_t& geometry) const
{
    std::vector<skip_zone_t> zones{
        {geometry.yes_end, c::k_endpoint_skip_r},
        {geometry.no_end,  c::k_endpoint_skip_r}
    };
    if (geometry.hover_active) {
        zones.push_back({geometry.hover.yes_point, c::k_hover_skip_r});
        zones.push_back({geometry.hover.no_point,  c::k_hover_skip_r});
    }
    return zones;
}

chart_geometry_t Chart_layout_engine::layout(const parameters_t& params) const
{
    ODDS_CHART_PROFILE_SCOPE(params.profiler, "odds_chart.layout");

    chart_geometry_t geometry;
    if (!params.display_series || params.display_series->empty()) {
        if (params.log_error) {
            params.log_error("odds_chart: layout called with an empty display series");
        }
        return geometry;
    }

    const std::vector<double>& series = *params.display_series;
    const plot_viewport_t& viewport   = params.viewport;
    const variant_metrics_t& metrics  = metrics_for(params.variant);
    const std::size_t n = series.size();

    // Curves
    {
        ODDS_CHART_PROFILE_SCOPE(params.profiler, "odds_chart.layout.curves");
        geometry.points.reserve(n);
        geometry.yes_points.reserve(n);
        geometry.no_points.reserve(n);
        for (std::size_t j = 0; j < n; ++j) {
            const double x = x_for_index(viewport, j, n);
            const separated_pair_t pair = separated_for_probability(viewport, series[j]);
            geometry.points.push_back({x, pair.yes_y, pair.no_y});
            geometry.yes_points.emplace_back(x, pair.yes_y);
            geometry.no_points.emplace_back(x, pair.no_y);
        }
        geometry.yes_end = geometry.yes_points.back();
        geometry.no_end  = geometry.no_points.back();
    }

    // Hover
    geometry.hover_active = params.hover_x.has_value();
    geometry.hover = resolve_hover(series, viewport, params.hover_x);
    geometry.endpoint_opacity   = geometry.hover_active ? c::k_hover_endpoint_alpha : 1.0;
    geometry.show_current_pulse = !geometry.hover_active || geometry.hover.t > c::k_hover_pulse_t;

    if (geometry.hover_active) {
        fade_rect_t fade;
        fade.x      = geometry.hover.x;
        fade.y      = viewport.top;
        fade.width  = std::max(0.0, viewport.right - geometry.hover.x);
        fade.height = viewport.y_span();
        geometry.fade_rect = fade;
    }

    // Readouts follow the hover point while hovering, the curve ends otherwise
    {
        ODDS_CHART_PROFILE_SCOPE(params.profiler, "odds_chart.layout.readouts");
        const glm::dvec2 yes_anchor = geometry.hover_active ? geometry.hover.yes_point : geometry.yes_end;
        const glm::dvec2 no_anchor  = geometry.hover_active ? geometry.hover.no_point  : geometry.no_end;
        const double probability    = geometry.hover_active ? geometry.hover.value : params.current_probability;
        geometry.readouts = layout_readouts(
            viewport, metrics, yes_anchor, no_anchor, probability, geometry.hover_active);
    }

    // Decorations
    {
        ODDS_CHART_PROFILE_SCOPE(params.profiler, "odds_chart.layout.decorations");
        geometry.skip_zones = build_skip_zones(geometry);

        const double opacity = params.is_live ? c::k_trail_opacity_live : c::k_trail_opacity_idle;
        const double scale   = c::k_trail_mark_scale * (c::k_trail_mark_width / c::k_trail_mark_viewbox);

        geometry.yes_trail.marks   = place_decorations(geometry.yes_points, geometry.skip_zones);
        geometry.yes_trail.opacity = opacity;
        geometry.yes_trail.scale   = scale;
        geometry.no_trail.marks    = place_decorations(geometry.no_points, geometry.skip_zones);
        geometry.no_trail.opacity  = opacity;
        geometry.no_trail.scale    = scale;
    }

    // Tooltip
    if (geometry.hover_active && params.window && params.format_hover_time) {
        const double hover_time = time_at_fraction(*params.window, geometry.hover.t);
        geometry.hover_time_box = place_hover_time_box(
            viewport, metrics, geometry.hover.x,
            params.format_hover_time(hover_time) + k_hover_time_suffix);
    }

    geometry.guide_lines = build_guide_lines(viewport);
    return geometry;
}

chart_geometry_t Chart_layout_engine::layout(
    const std::vector<double>& display_series,
    const plot_viewport_t& viewport,
    std::optional<double> hover_x,
    Chart_variant variant) const
{
    parameters_t params;
    params.display_series = &display_series;
    params.viewport       = viewport;
    params.variant        = variant;
    params.hover_x        = hover_x;
    if (!display_series.empty()) {
        params.current_probability = display_series.back();
    }
    return layout(params);
}

} // namespace odds::chart
