#pragma once

// odds_chart - Exchange Time Formatting
// Formatters that render timestamps in US Eastern time, and a Chart_config
// wired to them and to Qt's message log.

#include <odds_chart/core/chart_config.h>

#include <string>

namespace odds::chart {

/// Axis tick text, e.g. "3:05 pm".
std::string format_et_time(double timestamp);

/// Hover tooltip text without the zone suffix, e.g. "Oct 19, 3:05 PM".
std::string format_et_hover_time(double timestamp);

/// Default config with the Eastern-time formatters installed and logging
/// routed to qDebug / qWarning.
Chart_config make_qt_chart_config();

} // namespace odds::chart
