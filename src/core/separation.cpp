#include <odds_chart/core/separation.h>
#include <odds_chart/core/constants.h>

#include <cmath>

namespace odds::chart {

namespace c = constants;

double y_from_probability(const plot_viewport_t& viewport, double probability) noexcept
{
    return viewport.bottom - probability * viewport.y_span();
}

separated_pair_t enforce_min_gap(separated_pair_t pair, double min_gap) noexcept
{
    if (std::abs(pair.no_y - pair.yes_y) < min_gap) {
        const double mid = (pair.yes_y + pair.no_y) / 2.0;
        pair.yes_y = mid - min_gap / 2.0;
        pair.no_y  = mid + min_gap / 2.0;
    }
    return pair;
}

separated_pair_t clamp_pair_top(separated_pair_t pair, double min_y) noexcept
{
    if (pair.yes_y < min_y) {
        const double shift = min_y - pair.yes_y;
        pair.yes_y += shift;
        pair.no_y  += shift;
    }
    return pair;
}

separated_pair_t clamp_pair_bottom(separated_pair_t pair, double max_y) noexcept
{
    if (pair.no_y > max_y) {
        const double shift = pair.no_y - max_y;
        pair.yes_y -= shift;
        pair.no_y  -= shift;
    }
    return pair;
}

separated_pair_t separate_series_y(
    const plot_viewport_t& viewport,
    double yes_y_raw,
    double no_y_raw) noexcept
{
    separated_pair_t pair{yes_y_raw, no_y_raw};
    pair = enforce_min_gap(pair, c::k_min_series_separation);
    pair = clamp_pair_top(pair, viewport.top + c::k_curve_edge_inset);
    pair = clamp_pair_bottom(pair, viewport.bottom - c::k_curve_edge_inset);
    return pair;
}

separated_pair_t separated_for_probability(
    const plot_viewport_t& viewport,
    double yes_probability) noexcept
{
    return separate_series_y(
        viewport,
        y_from_probability(viewport, yes_probability),
        y_from_probability(viewport, 1.0 - yes_probability));
}

} // namespace odds::chart
