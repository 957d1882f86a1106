#include <odds_chart/core/chart_builder.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/constants.h>
#include <odds_chart/core/time_axis.h>

#include <cmath>
#include <string>
#include <utility>

namespace odds::chart {

namespace c = constants;

Chart_builder::Chart_builder(Chart_config config)
:
    m_config(std::move(config))
{
    if (!m_config.format_axis_time) {
        m_config.format_axis_time = &default_format_axis_time;
    }
    if (!m_config.format_hover_time) {
        m_config.format_hover_time = &default_format_hover_time;
    }
    if (m_config.series_cache_capacity > 0) {
        m_cache = std::make_unique<Series_cache>(m_config.series_cache_capacity);
    }
}

double Chart_builder::sanitize_probability(const market_t& market) const
{
    const double p = market.current_probability();
    if (std::isfinite(p)) {
        return p;
    }
    if (m_config.log_error) {
        m_config.log_error("odds_chart: market '" + market.id +
            "' has a non-finite price, using " + format_fixed(c::k_default_probability, 2));
    }
    return c::k_default_probability;
}

const generated_series_t& Chart_builder::series_for(
    const std::string& market_id,
    double probability,
    Time_scale scale) const
{
    if (!m_cache) {
        m_uncached = m_generator.generate(market_id, probability, scale);
        return m_uncached;
    }

    const auto key = series_cache_key_t::make(market_id, probability, scale);
    if (const generated_series_t* hit = m_cache->try_get(key)) {
        return *hit;
    }

    if (m_config.log_debug) {
        m_config.log_debug("odds_chart: generating series for '" + market_id +
            "' at " + format_fixed(probability, 4) + " (" + time_scale_key(scale) + ")");
    }
    return m_cache->store(key, m_generator.generate(market_id, probability, scale));
}

void Chart_builder::clear_cache() const
{
    if (m_cache) {
        m_cache->invalidate();
    }
}

chart_frame_t Chart_builder::build(const market_t& market, const view_state_t& view) const
{
    Profiler* profiler = m_config.profiler.get();
    ODDS_CHART_PROFILE_SCOPE(profiler, "odds_chart.build");

    const double probability = sanitize_probability(market);

    chart_frame_t frame;
    frame.market_id  = market.id;
    frame.time_scale = view.time_scale;
    frame.variant    = view.variant;

    {
        ODDS_CHART_PROFILE_SCOPE(profiler, "odds_chart.build.series");
        frame.display_series = series_for(market.id, probability, view.time_scale).display_series;
    }

    {
        ODDS_CHART_PROFILE_SCOPE(profiler, "odds_chart.build.axes");
        frame.viewport = make_plot_viewport(view.chart_aspect(), view.variant);
        frame.window   = make_time_window(view.time_scale, view.now_seconds);
        frame.x_labels = build_x_labels(frame.window, m_config.format_axis_time);
    }

    Chart_layout_engine::parameters_t params;
    params.display_series      = &frame.display_series;
    params.viewport            = frame.viewport;
    params.variant             = view.variant;
    params.is_live             = market.is_live;
    params.current_probability = probability;
    params.window              = frame.window;
    params.format_hover_time   = m_config.format_hover_time;
    params.profiler            = profiler;
    params.log_error           = m_config.log_error;
    if (view.hover.active_for(market.id)) {
        params.hover_x = view.hover.hover_x;
    }

    frame.geometry = m_layout.layout(params);

    // Legend mirrors the readouts: hovered value while hovering
    const double legend_probability = frame.geometry.hover_active
        ? frame.geometry.hover.value
        : probability;
    frame.legend_yes_pct = round_percent(legend_probability);
    frame.legend_no_pct  = 100 - frame.legend_yes_pct;
    frame.volume_label   = format_volume_label(market.volume_btc);
    return frame;
}

} // namespace odds::chart
