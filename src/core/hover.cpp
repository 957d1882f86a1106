#include <odds_chart/core/hover.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/separation.h>

#include <algorithm>

namespace odds::chart {

using namespace detail;

double x_for_index(const plot_viewport_t& viewport, std::size_t j, std::size_t n) noexcept
{
    return viewport.left + index_fraction(j, n) * viewport.x_span();
}

double hover_fraction(const plot_viewport_t& viewport, double x) noexcept
{
    const double span = viewport.x_span();
    if (span <= 0.0) {
        return 1.0;
    }
    return clamp_unit((x - viewport.left) / span);
}

hover_sample_t resolve_hover(
    const std::vector<double>& display_series,
    const plot_viewport_t& viewport,
    std::optional<double> hover_x)
{
    const std::size_t n = display_series.size();

    hover_sample_t sample;
    sample.x = hover_x
        ? std::max(viewport.left, std::min(viewport.right, *hover_x))
        : x_for_index(viewport, n - 1, n);
    sample.t = hover_fraction(viewport, sample.x);
    sample.value = sample_at_position(display_series, sample.t * static_cast<double>(n - 1));

    const separated_pair_t pair = separated_for_probability(viewport, sample.value);
    sample.yes_point = glm::dvec2(sample.x, pair.yes_y);
    sample.no_point  = glm::dvec2(sample.x, pair.no_y);
    return sample;
}

} // namespace odds::chart
