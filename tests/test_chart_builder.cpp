// odds_chart - Chart Builder & Series Cache Tests

#include <odds_chart/core/algo.h>
#include <odds_chart/core/chart_builder.h>
#include <odds_chart/core/series_cache.h>

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace odds::chart;

namespace {

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "OK" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            ++failed; \
        } \
    } while (0)

// Records scope names and checks nesting.
class Recording_profiler : public Profiler
{
public:
    void begin_scope(const char* name) override
    {
        names.emplace_back(name);
        ++depth;
    }

    void end_scope() override
    {
        --depth;
        if (depth < 0) {
            unbalanced = true;
        }
    }

    bool saw(const std::string& name) const
    {
        for (const auto& n : names) {
            if (n == name) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> names;
    int  depth      = 0;
    bool unbalanced = false;
};

market_t make_market(const std::string& id, double price)
{
    market_t market;
    market.id        = id;
    market.yes_price = price;
    return market;
}

view_state_t make_view(Time_scale scale, Chart_variant variant = Chart_variant::DETAIL)
{
    view_state_t view;
    view.time_scale  = scale;
    view.variant     = variant;
    view.now_seconds = 86400.0;
    return view;
}

// -----------------------------------------------------------------------------

bool test_build_frame()
{
    const Chart_builder builder;
    const chart_frame_t frame = builder.build(make_market("mkt-3", 0.62), make_view(Time_scale::D1));

    TEST_ASSERT(frame.market_id == "mkt-3", "market id");
    TEST_ASSERT(frame.display_series.size() == 56, "display size");
    TEST_ASSERT(frame.display_series.back() == 0.62, "last value");
    TEST_ASSERT(frame.viewport.width == 420.0, "detail aspect");
    TEST_ASSERT(frame.geometry.points.size() == 56, "geometry points");
    TEST_ASSERT(frame.legend_yes_pct == 62 && frame.legend_no_pct == 38, "legend");
    TEST_ASSERT(frame.window.start_seconds == 0.0 && frame.window.end_seconds == 86400.0, "window");

    TEST_ASSERT(frame.x_labels.size() == 5, "quarter labels");
    TEST_ASSERT(frame.x_labels[0].text == "00:00", "first label");
    TEST_ASSERT(frame.x_labels[1].text == "06:00", "second label");
    TEST_ASSERT(frame.x_labels[4].text == "00:00", "last label");
    TEST_ASSERT(frame.x_labels[0].offset_hours == 24.0, "offset hours");
    return true;
}

bool test_home_variant_and_thirds()
{
    const Chart_builder builder;
    const chart_frame_t frame = builder.build(
        make_market("mkt-3", 0.5), make_view(Time_scale::H1, Chart_variant::HOME));

    TEST_ASSERT(frame.viewport.width == 320.0, "home aspect");
    TEST_ASSERT(frame.display_series.size() == 28, "1H points");
    TEST_ASSERT(frame.x_labels.size() == 4, "third labels");
    TEST_ASSERT(frame.x_labels.front().text == "23:00", "window start");
    TEST_ASSERT(frame.x_labels.back().text == "00:00", "window end");
    return true;
}

bool test_hover_routing()
{
    const Chart_builder builder;
    view_state_t view = make_view(Time_scale::D1);
    view.hover.active_market_id = "other";
    view.hover.hover_x = 100.0;

    const chart_frame_t other = builder.build(make_market("mkt-3", 0.62), view);
    TEST_ASSERT(!other.geometry.hover_active, "hover on another chart is ignored");

    view.hover.active_market_id = "mkt-3";
    const chart_frame_t mine = builder.build(make_market("mkt-3", 0.62), view);
    TEST_ASSERT(mine.geometry.hover_active, "hover on this chart");
    TEST_ASSERT(mine.geometry.hover_time_box.has_value(), "tooltip");
    const std::string& text = mine.geometry.hover_time_box->text;
    TEST_ASSERT(text.size() > 3 && text.compare(text.size() - 3, 3, " ET") == 0, "tooltip suffix");
    TEST_ASSERT(mine.legend_yes_pct == round_percent(mine.geometry.hover.value), "legend follows hover");
    TEST_ASSERT(mine.legend_yes_pct + mine.legend_no_pct == 100, "legend sums to 100");
    return true;
}

bool test_missing_and_invalid_price()
{
    int errors = 0;
    Chart_config config = Chart_config::make_default();
    config.log_error = [&errors](const std::string&) { ++errors; };
    const Chart_builder builder(config);

    market_t missing;
    missing.id = "mkt-5";
    const chart_frame_t a = builder.build(missing, make_view(Time_scale::H6));
    TEST_ASSERT(errors == 0, "a missing price is not an error");
    TEST_ASSERT(a.display_series.back() == 0.5, "missing price defaults to 0.5");

    const chart_frame_t b = builder.build(
        make_market("mkt-5", std::numeric_limits<double>::quiet_NaN()), make_view(Time_scale::H6));
    TEST_ASSERT(errors == 1, "non-finite price reported");
    TEST_ASSERT(b.display_series.back() == 0.5, "non-finite price replaced");
    TEST_ASSERT(b.legend_yes_pct == 50 && b.legend_no_pct == 50, "legend");
    return true;
}

bool test_series_memoised()
{
    int generated = 0;
    Chart_config config = Chart_config::make_default();
    config.log_debug = [&generated](const std::string&) { ++generated; };
    const Chart_builder builder(config);

    const generated_series_t& first  = builder.series_for("mkt-3", 0.4, Time_scale::H3);
    const generated_series_t& second = builder.series_for("mkt-3", 0.4, Time_scale::H3);
    TEST_ASSERT(&first == &second, "cache hit returns the stored series");
    TEST_ASSERT(generated == 1, "generated once");

    const Series_generator gen;
    TEST_ASSERT(first.display_series == gen.generate("mkt-3", 0.4, Time_scale::H3).display_series,
        "cached series equals a fresh one");

    (void)builder.series_for("mkt-3", 0.41, Time_scale::H3);
    (void)builder.series_for("mkt-3", 0.4, Time_scale::H6);
    TEST_ASSERT(generated == 3, "new price or scale generates again");

    builder.clear_cache();
    (void)builder.series_for("mkt-3", 0.4, Time_scale::H3);
    TEST_ASSERT(generated == 4, "cleared cache generates again");
    return true;
}

bool test_cache_disabled()
{
    Chart_config config = Chart_config::make_default();
    config.series_cache_capacity = 0;
    const Chart_builder builder(config);

    const chart_frame_t a = builder.build(make_market("mkt-9", 0.3), make_view(Time_scale::H12));
    const chart_frame_t b = builder.build(make_market("mkt-9", 0.3), make_view(Time_scale::H12));
    TEST_ASSERT(a.display_series == b.display_series, "deterministic without cache");
    TEST_ASSERT(a.display_series.size() == 48, "12H points");
    return true;
}

bool test_cache_lru_eviction()
{
    const Series_generator gen;
    Series_cache cache(2);

    const auto key_a = series_cache_key_t::make("a", 0.5, Time_scale::D1);
    const auto key_b = series_cache_key_t::make("b", 0.5, Time_scale::D1);
    const auto key_c = series_cache_key_t::make("c", 0.5, Time_scale::D1);

    cache.store(key_a, gen.generate("a", 0.5, Time_scale::D1));
    cache.store(key_b, gen.generate("b", 0.5, Time_scale::D1));
    TEST_ASSERT(cache.try_get(key_a) != nullptr, "a present");

    cache.store(key_c, gen.generate("c", 0.5, Time_scale::D1));
    TEST_ASSERT(cache.size() == 2, "bounded");
    TEST_ASSERT(cache.try_get(key_b) == nullptr, "least recently used evicted");
    TEST_ASSERT(cache.try_get(key_a) != nullptr, "recently used kept");
    TEST_ASSERT(cache.try_get(key_c) != nullptr, "newest kept");

    cache.invalidate();
    TEST_ASSERT(cache.size() == 0, "invalidate clears");
    return true;
}

bool test_cache_key()
{
    const auto a = series_cache_key_t::make("m", 0.5, Time_scale::D1);
    TEST_ASSERT(a == series_cache_key_t::make("m", 0.5, Time_scale::D1), "equal keys");
    TEST_ASSERT(a != series_cache_key_t::make("m", 0.5000001, Time_scale::D1), "price");
    TEST_ASSERT(a != series_cache_key_t::make("m", 0.5, Time_scale::H1), "scale");
    TEST_ASSERT(a != series_cache_key_t::make("n", 0.5, Time_scale::D1), "id");

    const series_cache_key_hash_t hash{};
    TEST_ASSERT(hash(a) == hash(series_cache_key_t::make("m", 0.5, Time_scale::D1)), "stable hash");
    return true;
}

bool test_profiler_scopes()
{
    auto profiler = std::make_shared<Recording_profiler>();
    Chart_config config = Chart_config::make_default();
    config.profiler = profiler;
    const Chart_builder builder(config);

    view_state_t view = make_view(Time_scale::D1);
    view.hover.active_market_id = "mkt-3";
    view.hover.hover_x = 150.0;
    (void)builder.build(make_market("mkt-3", 0.62), view);

    TEST_ASSERT(profiler->depth == 0 && !profiler->unbalanced, "balanced scopes");
    TEST_ASSERT(profiler->saw("odds_chart.build"), "build scope");
    TEST_ASSERT(profiler->saw("odds_chart.build.series"), "series scope");
    TEST_ASSERT(profiler->saw("odds_chart.build.axes"), "axes scope");
    TEST_ASSERT(profiler->saw("odds_chart.layout"), "layout scope");
    TEST_ASSERT(profiler->saw("odds_chart.layout.curves"), "curves scope");
    TEST_ASSERT(profiler->saw("odds_chart.layout.readouts"), "readouts scope");
    TEST_ASSERT(profiler->saw("odds_chart.layout.decorations"), "decorations scope");
    return true;
}

bool test_volume_label()
{
    TEST_ASSERT(format_volume_label(0.0) == "0.00 BTC vol", "zero keeps two decimals");
    TEST_ASSERT(format_volume_label(0.5) == "0.50 BTC vol", "below one keeps two decimals");
    TEST_ASSERT(format_volume_label(3.0) == "3.0 BTC vol", "one decimal at least");
    TEST_ASSERT(format_volume_label(12.25) == "12.25 BTC vol", "two decimals at most");
    TEST_ASSERT(format_volume_label(12.5) == "12.5 BTC vol", "trailing zero dropped");
    TEST_ASSERT(format_volume_label(1234.5) == "1,234.5 BTC vol", "thousands grouped");
    TEST_ASSERT(format_volume_label(1234567.0) == "1,234,567.0 BTC vol", "millions grouped");
    TEST_ASSERT(format_volume_label(std::numeric_limits<double>::infinity()) == "0.00 BTC vol",
        "non-finite shown as zero");

    const Chart_builder builder;
    market_t market = make_market("mkt-3", 0.62);
    market.volume_btc = 1520.75;
    const chart_frame_t frame = builder.build(market, make_view(Time_scale::D1));
    TEST_ASSERT(frame.volume_label == "1,520.75 BTC vol", "frame volume: " << frame.volume_label);
    return true;
}

bool test_custom_formatters()
{
    Chart_config config = Chart_config::make_default();
    config.format_axis_time  = [](double) { return std::string("tick"); };
    config.format_hover_time = [](double) { return std::string("when"); };
    const Chart_builder builder(config);

    view_state_t view = make_view(Time_scale::H6);
    view.hover.active_market_id = "mkt-1";
    view.hover.hover_x = 50.0;
    const chart_frame_t frame = builder.build(make_market("mkt-1", 0.2), view);

    TEST_ASSERT(frame.x_labels.size() == 4, "6H uses thirds");
    for (const auto& label : frame.x_labels) {
        TEST_ASSERT(label.text == "tick", "axis formatter");
    }
    TEST_ASSERT(frame.geometry.hover_time_box && frame.geometry.hover_time_box->text == "when ET", "hover formatter");
    return true;
}

} // anonymous namespace

int main()
{
    std::cout << "Chart Builder Test Suite\n";
    std::cout << "========================\n\n";

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_build_frame);
    RUN_TEST(test_home_variant_and_thirds);
    RUN_TEST(test_hover_routing);
    RUN_TEST(test_missing_and_invalid_price);
    RUN_TEST(test_series_memoised);
    RUN_TEST(test_cache_disabled);
    RUN_TEST(test_cache_lru_eviction);
    RUN_TEST(test_cache_key);
    RUN_TEST(test_profiler_scopes);
    RUN_TEST(test_volume_label);
    RUN_TEST(test_custom_formatters);

    std::cout << "\n========================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";

    return failed > 0 ? 1 : 0;
}
