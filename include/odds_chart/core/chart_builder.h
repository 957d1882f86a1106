#pragma once

// odds_chart - Chart Builder
// One render pass: market + view state -> chart frame.
// Owns the generator, the layout engine and the optional series cache.

#include "chart_config.h"
#include "chart_layout.h"
#include "series_cache.h"
#include "series_generator.h"
#include "types.h"

#include <memory>

namespace odds::chart {

class Chart_builder
{
public:
    explicit Chart_builder(Chart_config config = Chart_config::make_default());

    /// Build the frame for a market. Total: malformed prices are reported
    /// through log_error and replaced by the default probability.
    chart_frame_t build(const market_t& market, const view_state_t& view) const;

    /// Generated series for a market, through the cache when enabled.
    const generated_series_t& series_for(
        const std::string& market_id,
        double probability,
        Time_scale scale) const;

    const Chart_config& config() const noexcept { return m_config; }

    void clear_cache() const;

private:
    double sanitize_probability(const market_t& market) const;

    Chart_config        m_config;
    Series_generator    m_generator;
    Chart_layout_engine m_layout;

    // Caching is an optimisation; build() stays logically const.
    mutable std::unique_ptr<Series_cache> m_cache;
    mutable generated_series_t            m_uncached;
};

} // namespace odds::chart
