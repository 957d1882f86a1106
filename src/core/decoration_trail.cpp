#include <odds_chart/core/decoration_trail.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/constants.h>

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>

namespace odds::chart {

namespace c = constants;

namespace {

constexpr double k_rad_to_deg = 57.295779513082320876798154814105;

} // anonymous namespace

Arc_length_path::Arc_length_path(const std::vector<glm::dvec2>& points)
{
    if (points.size() < 2) {
        return;
    }

    m_segments.reserve(points.size() - 1);
    double cumulative = 0.0;
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        const glm::dvec2 delta = points[i + 1] - points[i];
        const double len = glm::length(delta);
        if (len < c::k_trail_min_segment) {
            continue;
        }
        m_segments.push_back(segment_t{points[i], delta, len, cumulative});
        cumulative += len;
    }
    m_total_length = cumulative;
}

Arc_length_path::location_t Arc_length_path::locate(double distance) const
{
    std::size_t index = m_segments.size() - 1;
    for (std::size_t i = 0; i < m_segments.size(); ++i) {
        const segment_t& seg = m_segments[i];
        if (distance >= seg.cumulative_start && distance <= seg.cumulative_start + seg.length) {
            index = i;
            break;
        }
    }

    const segment_t& seg = m_segments[index];
    const double t = detail::clamp_unit((distance - seg.cumulative_start) / seg.length);

    location_t loc;
    loc.point         = seg.from + seg.delta * t;
    loc.normal        = glm::dvec2(-seg.delta.y, seg.delta.x) / seg.length;
    loc.heading_deg   = std::atan2(seg.delta.y, seg.delta.x) * k_rad_to_deg;
    loc.segment_index = index;
    return loc;
}

std::vector<double> trail_sample_distances(
    double total_length,
    const trail_params_t& params)
{
    const double dist_start = std::min(params.start_inset, total_length);
    const double dist_end   = std::max(dist_start, total_length - params.end_inset);

    std::vector<double> distances;
    if (params.step > 0.0) {
        for (int k = 0;; ++k) {
            const double dist = dist_start + params.step * k;
            if (dist > dist_end) {
                break;
            }
            distances.push_back(dist);
        }
    }

    if (distances.empty() || dist_end - distances.back() > params.step * params.tail_fraction) {
        distances.push_back(dist_end);
    }
    return distances;
}

bool inside_any_zone(const glm::dvec2& p, const std::vector<skip_zone_t>& zones) noexcept
{
    return std::any_of(zones.begin(), zones.end(), [&p](const skip_zone_t& zone) {
        const glm::dvec2 d = p - zone.center;
        return glm::dot(d, d) <= zone.radius * zone.radius;
    });
}

std::vector<decoration_t> place_decorations(
    const std::vector<glm::dvec2>& points,
    const std::vector<skip_zone_t>& skip_zones,
    const trail_params_t& params)
{
    const Arc_length_path path(points);
    if (path.empty()) {
        return {};
    }

    const std::vector<double> distances = trail_sample_distances(path.total_length(), params);

    std::vector<decoration_t> marks;
    marks.reserve(distances.size());

    // The side alternates per sample, including samples dropped by a skip
    // zone, so a gap in the trail does not flip the stepping pattern.
    int parity_index = 0;
    for (std::size_t sample_index = 0; sample_index < distances.size(); ++sample_index) {
        const Arc_length_path::location_t loc = path.locate(distances[sample_index]);
        const bool even = (parity_index % 2 == 0);
        const double lateral = even ? params.lateral : -params.lateral;

        decoration_t mark;
        mark.anchor       = loc.point;
        mark.position     = loc.point + loc.normal * lateral;
        mark.angle_deg    = loc.heading_deg + 90.0 + (even ? params.tilt_deg : -params.tilt_deg);
        mark.parity_index = parity_index;
        ++parity_index;

        if (inside_any_zone(mark.position, skip_zones)) {
            continue;
        }
        marks.push_back(mark);
    }
    return marks;
}

} // namespace odds::chart
