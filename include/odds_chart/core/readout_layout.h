#pragma once

// odds_chart - Readout Layout
// Places the Yes/No "label + percentage" blocks beside the current or
// hovered point without overlap and inside the viewport.
//
// Order of operations is fixed: clamp each top, spread the pair to the
// minimum gap, clamp again, and finally push No below Yes if clamping
// closed the gap.

#include "types.h"
#include "variant_metrics.h"

namespace odds::chart {

struct readout_tops_t
{
    double yes_top = 0.0;
    double no_top  = 0.0;
};

/// Minimum distance between the two block tops.
[[nodiscard]] double readout_min_gap(const variant_metrics_t& metrics) noexcept;

/// Top of a block sitting just above a curve point at anchor_y.
[[nodiscard]] double readout_target_top(const variant_metrics_t& metrics, double anchor_y) noexcept;

/// Keep a block top within [top + 0.6, bottom - block_height - 0.6].
[[nodiscard]] double clamp_readout_top(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double top_y) noexcept;

/// Recentre both tops around their midpoint when closer than min_gap.
[[nodiscard]] readout_tops_t spread_readout_tops(readout_tops_t tops, double min_gap) noexcept;

/// Clamp both, then force No to Yes + min_gap if the gap was lost.
[[nodiscard]] readout_tops_t reclamp_readout_tops(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    readout_tops_t tops) noexcept;

/// Full placement for anchors at yes_anchor_y / no_anchor_y.
[[nodiscard]] readout_tops_t place_readout_tops(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double yes_anchor_y,
    double no_anchor_y) noexcept;

/// Horizontal position of both blocks.
[[nodiscard]] double readout_x(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    double anchor_x,
    bool hover_active) noexcept;

/// Tops plus text baselines and percentages.
[[nodiscard]] readout_pair_t layout_readouts(
    const plot_viewport_t& viewport,
    const variant_metrics_t& metrics,
    const glm::dvec2& yes_anchor,
    const glm::dvec2& no_anchor,
    double yes_probability,
    bool hover_active) noexcept;

} // namespace odds::chart
