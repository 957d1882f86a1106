#pragma once
// odds_chart - Main Header
// Probability chart geometry for Yes/No prediction markets.
//
// This library provides:
// - Deterministic synthetic price history per market (Series_generator)
// - Plot-space geometry for both outcome curves, readouts, decoration
//   trails and the hover tooltip (Chart_layout_engine)
// - A one-call render pass with series memoisation (Chart_builder)
// - Qt integration for shared view state and Eastern-time labels
//
// Usage:
//   odds::chart::Chart_builder builder;
//   odds::chart::market_t market{"mkt-3", 0.62};
//   odds::chart::view_state_t view;
//   const auto frame = builder.build(market, view);
//   // draw frame.geometry with any 2D backend
#include <odds_chart/core/types.h>
#include <odds_chart/core/chart_config.h>
#include <odds_chart/core/constants.h>
#include <odds_chart/core/algo.h>
#include <odds_chart/core/series_generator.h>
#include <odds_chart/core/chart_layout.h>
#include <odds_chart/core/time_axis.h>
#include <odds_chart/core/series_cache.h>
#include <odds_chart/core/chart_builder.h>

#if defined(ODDS_CHART_WITH_QT)
#include <odds_chart/qt/chart_view_state.h>
#include <odds_chart/qt/et_time_format.h>
#endif

namespace odds::chart {

// Library version
constexpr int k_version_major = 0;
constexpr int k_version_minor = 1;
constexpr int k_version_patch = 0;

constexpr const char* k_version_string = "0.1.0";

} // namespace odds::chart
