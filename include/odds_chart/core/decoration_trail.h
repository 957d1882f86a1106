#pragma once

// odds_chart - Decoration Trail
// Arc-length parameterised placement of marks along a polyline.
// Marks alternate left/right of the line with a small tilt so the trail
// reads as footsteps; marks inside exclusion zones are dropped without
// breaking the alternation.

#include "constants.h"
#include "types.h"

#include <cstddef>
#include <vector>

namespace odds::chart {

/// Polyline with cumulative segment lengths; zero-length segments are skipped.
class Arc_length_path
{
public:
    struct segment_t
    {
        glm::dvec2 from{0.0};
        glm::dvec2 delta{0.0};
        double     length           = 0.0;
        double     cumulative_start = 0.0;
    };

    /// Position on the path at a given distance.
    struct location_t
    {
        glm::dvec2  point{0.0};
        glm::dvec2  normal{0.0};   ///< Unit normal (-dy, dx) / len
        double      heading_deg   = 0.0;
        std::size_t segment_index = 0;
    };

    explicit Arc_length_path(const std::vector<glm::dvec2>& points);

    [[nodiscard]] bool   empty() const noexcept { return m_segments.empty(); }
    [[nodiscard]] double total_length() const noexcept { return m_total_length; }
    [[nodiscard]] const std::vector<segment_t>& segments() const noexcept { return m_segments; }

    /// Locate a distance along the path. Distances past the end fall on the
    /// last segment. Requires a non-empty path.
    [[nodiscard]] location_t locate(double distance) const;

private:
    std::vector<segment_t> m_segments;
    double                 m_total_length = 0.0;
};

struct trail_params_t
{
    double step          = constants::k_trail_step;
    double start_inset   = constants::k_trail_start_inset;
    double end_inset     = constants::k_trail_end_inset;
    double lateral       = constants::k_trail_lateral;
    double tilt_deg      = constants::k_trail_tilt_deg;
    double tail_fraction = constants::k_trail_tail_fraction;
};

/// Distances at which marks are placed: start, start + step, ... up to
/// total - end_inset; the end distance is appended when the last regular
/// sample falls more than tail_fraction * step short of it.
[[nodiscard]] std::vector<double> trail_sample_distances(
    double total_length,
    const trail_params_t& params);

[[nodiscard]] bool inside_any_zone(const glm::dvec2& p, const std::vector<skip_zone_t>& zones) noexcept;

/// Place the marks for a polyline. An empty or degenerate path yields none.
[[nodiscard]] std::vector<decoration_t> place_decorations(
    const std::vector<glm::dvec2>& points,
    const std::vector<skip_zone_t>& skip_zones,
    const trail_params_t& params = trail_params_t{});

} // namespace odds::chart
