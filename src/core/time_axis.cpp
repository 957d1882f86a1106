#include <odds_chart/core/time_axis.h>

#include <utility>

namespace odds::chart {

namespace {

constexpr double k_seconds_per_hour = 3600.0;
constexpr int    k_quarter_ticks_from_hours = 12;

} // anonymous namespace

time_window_t make_time_window(Time_scale scale, double now_seconds) noexcept
{
    time_window_t window;
    window.hours         = time_scale_spec(scale).window_hours;
    window.end_seconds   = now_seconds;
    window.start_seconds = now_seconds - window.hours * k_seconds_per_hour;
    return window;
}

std::vector<double> x_label_fractions(int window_hours)
{
    if (window_hours >= k_quarter_ticks_from_hours) {
        return {0.0, 0.25, 0.5, 0.75, 1.0};
    }
    return {0.0, 1.0 / 3.0, 2.0 / 3.0, 1.0};
}

std::vector<x_label_t> build_x_labels(
    const time_window_t& window,
    const std::function<std::string(double)>& format_time)
{
    std::vector<x_label_t> labels;
    for (const double fraction : x_label_fractions(window.hours)) {
        x_label_t label;
        label.fraction     = fraction;
        label.offset_hours = window.hours * (1.0 - fraction);
        label.time         = time_at_fraction(window, fraction);
        if (format_time) {
            label.text = format_time(label.time);
        }
        labels.push_back(std::move(label));
    }
    return labels;
}

double time_at_fraction(const time_window_t& window, double t) noexcept
{
    return window.start_seconds + (window.end_seconds - window.start_seconds) * t;
}

} // namespace odds::chart
