#pragma once

// odds_chart - Time Axis
// Wall-clock window of a time scale and its tick labels.

#include "types.h"

#include <functional>
#include <string>
#include <vector>

namespace odds::chart {

/// Window of the scale ending at now_seconds.
[[nodiscard]] time_window_t make_time_window(Time_scale scale, double now_seconds) noexcept;

/// Tick fractions: quarters from 12h upwards, thirds below.
[[nodiscard]] std::vector<double> x_label_fractions(int window_hours);

/// Tick labels; text is produced by format_time (unix seconds -> text).
[[nodiscard]] std::vector<x_label_t> build_x_labels(
    const time_window_t& window,
    const std::function<std::string(double)>& format_time);

/// Time under a plot fraction t in [0, 1].
[[nodiscard]] double time_at_fraction(const time_window_t& window, double t) noexcept;

} // namespace odds::chart
