#include <odds_chart/core/readout_layout.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/constants.h>

#include <algorithm>

namespace odds::chart {

namespace c = constants;

namespace {

readout_block_t make_block(const variant_metrics_t& metrics, double top_y, int pct)
{
    readout_block_t block;
    block.top_y   = top_y;
    block.label_y = top_y + metrics.readout_label_font + c::k_readout_token_lift;
    block.pct_y   = block.label_y + metrics.readout_line_gap + metrics.readout_pct_font;
    block.pct     = pct;
    return block;
}

} // anonymous namespace

double readout_min_gap(const variant_metrics_t& metrics) noexcept
{
    return metrics.readout_block_height() + c::k_readout_extra_gap;
}

double readout_target_top(const variant_metrics_t& metrics, double anchor_y) noexcept
{
    return anchor_y - (metrics.readout_label_font + c::k_readout_anchor_lift);
}

double clamp_readout_top(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double top_y) noexcept
{
    const double min_top = viewport.top + c::k_readout_edge_inset;
    const double max_top = viewport.bottom - metrics.readout_block_height() - c::k_readout_edge_inset;
    return std::max(min_top, std::min(max_top, top_y));
}

readout_tops_t spread_readout_tops(readout_tops_t tops, double min_gap) noexcept
{
    if (tops.no_top - tops.yes_top < min_gap) {
        const double mid = (tops.no_top + tops.yes_top) / 2.0;
        tops.no_top  = mid + min_gap / 2.0;
        tops.yes_top = mid - min_gap / 2.0;
    }
    return tops;
}

readout_tops_t reclamp_readout_tops(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    readout_tops_t tops) noexcept
{
    const double min_gap = readout_min_gap(metrics);
    tops.no_top  = clamp_readout_top(viewport, metrics, tops.no_top);
    tops.yes_top = clamp_readout_top(viewport, metrics, tops.yes_top);
    if (tops.no_top - tops.yes_top < min_gap) {
        tops.no_top = clamp_readout_top(viewport, metrics, tops.yes_top + min_gap);
    }
    return tops;
}

readout_tops_t place_readout_tops(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double yes_anchor_y,
    double no_anchor_y) noexcept
{
    readout_tops_t tops;
    tops.no_top  = clamp_readout_top(viewport, metrics, readout_target_top(metrics, no_anchor_y));
    tops.yes_top = clamp_readout_top(viewport, metrics, readout_target_top(metrics, yes_anchor_y));
    tops = spread_readout_tops(tops, readout_min_gap(metrics));
    return reclamp_readout_tops(viewport, metrics, tops);
}

double readout_x(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double anchor_x,
    bool hover_active) noexcept
{
    const double target = anchor_x + (hover_active
        ? metrics.readout_hover_offset
        : metrics.readout_rest_offset);
    const double min_x = viewport.left + c::k_readout_min_x_inset;
    const double max_x = viewport.width - metrics.axis_gutter - c::k_readout_max_x_inset;
    return std::max(min_x, std::min(max_x, target));
}

readout_pair_t layout_readouts(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    const glm::dvec2& yes_anchor,
    const glm::dvec2& no_anchor,
    double yes_probability,
    bool hover_active) noexcept
{
    const readout_tops_t tops = place_readout_tops(viewport, metrics, yes_anchor.y, no_anchor.y);
    const int yes_pct = round_percent(yes_probability);

    readout_pair_t pair;
    pair.x            = readout_x(viewport, metrics, yes_anchor.x, hover_active);
    pair.label_font   = metrics.readout_label_font;
    pair.pct_font     = metrics.readout_pct_font;
    pair.stroke_width = metrics.readout_stroke_width;
    pair.yes = make_block(metrics, tops.yes_top, yes_pct);
    pair.no  = make_block(metrics, tops.no_top, 100 - yes_pct);
    return pair;
}

} // namespace odds::chart
