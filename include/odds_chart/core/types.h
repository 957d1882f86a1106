#pragma once

// odds_chart - Core Types
// Market snapshot, view state and chart geometry structures.
// Pure C++ with no framework dependencies.

#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace odds::chart {

// -----------------------------------------------------------------------------
// Market snapshot
// -----------------------------------------------------------------------------
// Supplied by the surrounding application, read-only for a render pass.
struct market_t
{
    std::string           id;
    std::optional<double> yes_price;
    bool                  is_live    = false;
    double                volume_btc = 0.0;

    [[nodiscard]] double current_probability() const noexcept
    {
        return yes_price.value_or(0.5);
    }
};

// -----------------------------------------------------------------------------
// Time scale
// -----------------------------------------------------------------------------
enum class Time_scale
{
    H1,
    H3,
    H6,
    H12,
    D1
};

struct time_scale_spec_t
{
    int window_hours        = 24;
    int display_point_count = 56;
};

// Fixed lookup: window length and number of displayed points per scale.
[[nodiscard]] constexpr time_scale_spec_t time_scale_spec(Time_scale scale) noexcept
{
    switch (scale) {
        case Time_scale::H1:  return {1, 28};
        case Time_scale::H3:  return {3, 34};
        case Time_scale::H6:  return {6, 40};
        case Time_scale::H12: return {12, 48};
        case Time_scale::D1:  return {24, 56};
    }
    return {24, 56};
}

[[nodiscard]] constexpr const char* time_scale_key(Time_scale scale) noexcept
{
    switch (scale) {
        case Time_scale::H1:  return "1H";
        case Time_scale::H3:  return "3H";
        case Time_scale::H6:  return "6H";
        case Time_scale::H12: return "12H";
        case Time_scale::D1:  return "1D";
    }
    return "1D";
}

[[nodiscard]] std::optional<Time_scale> parse_time_scale(std::string_view key) noexcept;

// -----------------------------------------------------------------------------
// Chart variant
// -----------------------------------------------------------------------------
// Compact chart on the market list vs. the full chart on the detail page.
enum class Chart_variant
{
    HOME,
    DETAIL
};

// -----------------------------------------------------------------------------
// View state
// -----------------------------------------------------------------------------

/// Pointer hover, owned and mutated by the presentation layer.
struct hover_state_t
{
    std::optional<std::string> active_market_id;
    std::optional<double>      hover_x;

    [[nodiscard]] bool active_for(std::string_view market_id) const noexcept
    {
        return active_market_id && hover_x && *active_market_id == market_id;
    }
};

/// Everything a render pass reads besides the market itself.
struct view_state_t
{
    Time_scale    time_scale          = Time_scale::D1;
    Chart_variant variant             = Chart_variant::DETAIL;
    double        chart_aspect_home   = 3.2;
    double        chart_aspect_detail = 4.2;
    hover_state_t hover;
    double        now_seconds         = 0.0;   ///< Unix seconds, right edge of the chart

    [[nodiscard]] double chart_aspect() const noexcept
    {
        return variant == Chart_variant::HOME ? chart_aspect_home : chart_aspect_detail;
    }
};

// -----------------------------------------------------------------------------
// Plot geometry
// -----------------------------------------------------------------------------

/// Plot area in abstract units; y grows downwards.
struct plot_viewport_t
{
    double width  = 0.0;
    double height = 0.0;
    double left   = 0.0;
    double right  = 0.0;
    double top    = 0.0;
    double bottom = 0.0;

    double axis_gutter   = 0.0;   ///< Right-hand strip holding the % ticks
    double readout_rail  = 0.0;   ///< Strip between plot and gutter for readouts

    [[nodiscard]] double x_span() const noexcept { return right - left; }
    [[nodiscard]] double y_span() const noexcept { return bottom - top; }
};

struct separated_pair_t
{
    double yes_y = 0.0;
    double no_y  = 0.0;
};

struct separated_point_t
{
    double x     = 0.0;
    double yes_y = 0.0;
    double no_y  = 0.0;
};

/// Hover cursor resolved against the display series.
struct hover_sample_t
{
    double x       = 0.0;
    double t       = 1.0;   ///< Fraction of the plot span, [0, 1]
    double value   = 0.0;   ///< Interpolated Yes probability
    glm::dvec2 yes_point{0.0};
    glm::dvec2 no_point{0.0};
};

struct readout_block_t
{
    double top_y   = 0.0;
    double label_y = 0.0;
    double pct_y   = 0.0;
    int    pct     = 0;
};

/// Both blocks share x, font sizes and the outline stroke.
struct readout_pair_t
{
    double          x            = 0.0;
    double          label_font   = 0.0;
    double          pct_font     = 0.0;
    double          stroke_width = 0.0;
    readout_block_t yes;
    readout_block_t no;
};

/// Circular region decorations must stay out of.
struct skip_zone_t
{
    glm::dvec2 center{0.0};
    double     radius = 0.0;
};

/// One mark of a decoration trail.
struct decoration_t
{
    glm::dvec2 anchor{0.0};      ///< Point on the polyline
    glm::dvec2 position{0.0};    ///< Anchor pushed sideways along the normal
    double     angle_deg    = 0.0;
    int        parity_index = 0;
};

struct decoration_trail_t
{
    std::vector<decoration_t> marks;
    double                    opacity = 1.0;
    double                    scale   = 1.0;
};

struct hover_time_box_t
{
    double      x         = 0.0;
    double      y         = 0.0;
    double      width     = 0.0;
    double      height    = 0.0;
    double      text_x    = 0.0;
    double      text_y    = 0.0;
    double      font_size    = 0.0;
    double      stroke_width = 0.0;
    std::string text;
};

struct guide_line_t
{
    int         level_pct = 0;
    double      y         = 0.0;
    std::string text;
};

struct x_label_t
{
    double      fraction     = 0.0;
    double      offset_hours = 0.0;
    double      time         = 0.0;   ///< Unix seconds
    std::string text;
};

/// Wall-clock extent of the displayed window.
struct time_window_t
{
    double start_seconds = 0.0;
    double end_seconds   = 0.0;
    int    hours         = 24;
};

/// Shaded region right of the hover cursor.
struct fade_rect_t
{
    double x      = 0.0;
    double y      = 0.0;
    double width  = 0.0;
    double height = 0.0;
};

/// Output of Chart_layout_engine.
struct chart_geometry_t
{
    std::vector<separated_point_t> points;
    std::vector<glm::dvec2>        yes_points;
    std::vector<glm::dvec2>        no_points;

    glm::dvec2 yes_end{0.0};
    glm::dvec2 no_end{0.0};

    bool           hover_active = false;
    hover_sample_t hover;

    readout_pair_t readouts;

    decoration_trail_t yes_trail;
    decoration_trail_t no_trail;
    std::vector<skip_zone_t> skip_zones;

    std::optional<hover_time_box_t> hover_time_box;
    std::optional<fade_rect_t>      fade_rect;

    std::vector<guide_line_t> guide_lines;

    double endpoint_opacity   = 1.0;
    bool   show_current_pulse = true;
};

/// Result of a whole render pass (Chart_builder).
struct chart_frame_t
{
    std::string            market_id;
    Time_scale             time_scale = Time_scale::D1;
    Chart_variant          variant    = Chart_variant::DETAIL;
    plot_viewport_t        viewport;
    time_window_t          window;
    std::vector<double>    display_series;
    chart_geometry_t       geometry;
    std::vector<x_label_t> x_labels;

    int legend_yes_pct = 50;
    int legend_no_pct  = 50;

    std::string volume_label;   ///< e.g. "1,234.5 BTC vol"
};

} // namespace odds::chart
