// odds_chart - Series Generator Tests

#include <odds_chart/core/constants.h>
#include <odds_chart/core/lcg_random.h>
#include <odds_chart/core/series_generator.h>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace odds::chart;

namespace {

constexpr double DOUBLE_TOLERANCE = 1e-12;

bool double_eq(double a, double b, double tol = DOUBLE_TOLERANCE)
{
    return std::abs(a - b) <= tol;
}

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " at line " << __LINE__ << std::endl; \
            return false; \
        } \
    } while(0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "PASS" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while(0)

// Test: LCG reproduces the reference sequence for seed 40
bool test_lcg_reference_sequence()
{
    Lcg_random rng(40);

    TEST_ASSERT(double_eq(rng.next(), 2075761068.0 / 4294967295.0), "first draw");
    TEST_ASSERT(rng.state() == 2075761068u, "state after first draw");
    TEST_ASSERT(double_eq(rng.next(), 2044872987.0 / 4294967295.0), "second draw");
    TEST_ASSERT(double_eq(rng.next(), 3115346878.0 / 4294967295.0), "third draw");

    Lcg_random centered(40);
    const double v = centered.next_centered(0.18);
    TEST_ASSERT(double_eq(v, (2075761068.0 / 4294967295.0 - 0.5) * 0.18), "centred draw");

    return true;
}

// Test: Draws stay within [0, 1]
bool test_lcg_range()
{
    for (std::uint32_t seed = 0; seed < 97; ++seed) {
        Lcg_random rng(seed);
        for (int i = 0; i < 500; ++i) {
            const double v = rng.next();
            TEST_ASSERT(v >= 0.0 && v <= 1.0, "draw out of range for seed " << seed);
        }
    }
    return true;
}

// Test: Seed is the UTF-16 code unit sum modulo 97
bool test_derive_seed()
{
    TEST_ASSERT(Series_generator::derive_seed("mkt-3") == 40u, "mkt-3 -> 40");
    TEST_ASSERT(Series_generator::derive_seed("") == 0u, "empty id -> 0");
    TEST_ASSERT(Series_generator::derive_seed("a") == 0u, "'a' (97) -> 0");

    // U+00E9 is one UTF-16 unit (233)
    TEST_ASSERT(Series_generator::derive_seed("\xC3\xA9") == 39u, "e-acute -> 39");

    // U+1F600 is a surrogate pair D83D DE00
    TEST_ASSERT(Series_generator::derive_seed("\xF0\x9F\x98\x80") == 57u, "emoji -> 57");

    return true;
}

// Test: Seed-derived parameters
bool test_seed_parameters()
{
    TEST_ASSERT(Series_generator::trend_sign_for_seed(40) == 1, "even seed trends up");
    TEST_ASSERT(Series_generator::trend_sign_for_seed(41) == -1, "odd seed trends down");

    TEST_ASSERT(double_eq(Series_generator::historical_bias_for_seed(40), 0.2), "bias for 40");
    TEST_ASSERT(double_eq(Series_generator::historical_bias_for_seed(43), -0.26), "bias for 43");
    TEST_ASSERT(double_eq(Series_generator::historical_bias_for_seed(44), 0.28), "bias for 44");

    return true;
}

// Test: Transition weight is flat, then a smoothstep into the current price
bool test_transition_weight()
{
    TEST_ASSERT(Series_generator::transition_weight(0.0) == 0.0, "start");
    TEST_ASSERT(Series_generator::transition_weight(0.88) == 0.0, "at transition start");
    TEST_ASSERT(double_eq(Series_generator::transition_weight(0.94), 0.5, 1e-9), "midpoint");
    TEST_ASSERT(double_eq(Series_generator::transition_weight(1.0), 1.0), "end");

    double prev = 0.0;
    for (int i = 0; i <= 100; ++i) {
        const double w = Series_generator::transition_weight(0.88 + 0.12 * i / 100.0);
        TEST_ASSERT(w + 1e-12 >= prev, "weight must be monotonic");
        prev = w;
    }
    return true;
}

// Test: Step kinds follow the index pattern
bool test_step_kinds()
{
    TEST_ASSERT(Series_generator::step_kind_for_index(0) == Step_kind::ANCHOR, "index 0");
    TEST_ASSERT(Series_generator::step_kind_for_index(1) == Step_kind::JITTER_STEP, "index 1");
    TEST_ASSERT(Series_generator::step_kind_for_index(2) == Step_kind::JITTER_STEP, "index 2");
    TEST_ASSERT(Series_generator::step_kind_for_index(3) == Step_kind::REAL_STEP, "index 3");
    TEST_ASSERT(Series_generator::step_kind_for_index(20) == Step_kind::JITTER_STEP, "index 20");
    TEST_ASSERT(Series_generator::step_kind_for_index(60) == Step_kind::REAL_STEP, "index 60");
    return true;
}

// Test: Same inputs, bit-identical output
bool test_determinism()
{
    const Series_generator gen;
    const auto a = gen.generate("mkt-7", 0.37, Time_scale::H6);
    const auto b = gen.generate("mkt-7", 0.37, Time_scale::H6);

    TEST_ASSERT(a.base_series == b.base_series, "base series must match");
    TEST_ASSERT(a.display_series == b.display_series, "display series must match");
    TEST_ASSERT(a.seed == b.seed, "seed must match");

    const auto other = gen.generate("mkt-8", 0.37, Time_scale::H6);
    TEST_ASSERT(other.base_series != a.base_series, "different ids should differ");

    return true;
}

// Test: Both series end exactly at the current price
bool test_last_value_pinned()
{
    const Series_generator gen;
    const double prices[] = {0.02, 0.13, 0.5, 0.777, 0.98};
    const Time_scale scales[] = {
        Time_scale::H1, Time_scale::H3, Time_scale::H6, Time_scale::H12, Time_scale::D1};

    for (const double p : prices) {
        for (const Time_scale scale : scales) {
            const auto s = gen.generate("pin", p, scale);
            TEST_ASSERT(s.base_series.back() == p, "base last value");
            TEST_ASSERT(s.display_series.back() == p, "display last value");
        }
    }
    return true;
}

// Test: All values stay within the probability bounds
bool test_values_bounded()
{
    const Series_generator gen;
    const char* ids[] = {"mkt-1", "mkt-2", "mkt-3", "btc-100k", "eth-etf", "z"};
    const double prices[] = {0.02, 0.05, 0.5, 0.95, 0.98};

    for (const char* id : ids) {
        for (const double p : prices) {
            const auto s = gen.generate(id, p, Time_scale::D1);
            for (const double v : s.base_series) {
                TEST_ASSERT(v >= constants::k_probability_min && v <= constants::k_probability_max,
                    "base value out of bounds for " << id);
            }
            for (const double v : s.display_series) {
                TEST_ASSERT(v >= constants::k_probability_min && v <= constants::k_probability_max,
                    "display value out of bounds for " << id);
            }
        }
    }
    return true;
}

// Test: Point counts and windows per scale
bool test_scale_windows()
{
    const Series_generator gen;
    struct expected_t { Time_scale scale; int hours; int points; };
    const expected_t cases[] = {
        {Time_scale::H1,  1,  28},
        {Time_scale::H3,  3,  34},
        {Time_scale::H6,  6,  40},
        {Time_scale::H12, 12, 48},
        {Time_scale::D1,  24, 56},
    };

    for (const auto& c : cases) {
        const auto s = gen.generate("mkt-9", 0.4, c.scale);
        TEST_ASSERT(s.window_hours == c.hours, "window hours for " << time_scale_key(c.scale));
        TEST_ASSERT(s.point_count == c.points, "point count for " << time_scale_key(c.scale));
        TEST_ASSERT(static_cast<int>(s.display_series.size()) == c.points, "display size");
        TEST_ASSERT(s.base_series.size() == static_cast<std::size_t>(constants::k_base_series_count), "base size");
        TEST_ASSERT(double_eq(s.window_start, 1.0 - c.hours / 24.0), "window start");
        TEST_ASSERT(s.window_end == 1.0, "window end");
    }
    return true;
}

// Test: "mkt-3" at 0.5 over one hour
bool test_mkt3_one_hour()
{
    const Series_generator gen;
    const auto s = gen.generate("mkt-3", 0.5, Time_scale::H1);

    TEST_ASSERT(s.seed == 40u, "seed");
    TEST_ASSERT(s.point_count == 28, "point count");
    TEST_ASSERT(s.window_hours == 1, "window hours");
    TEST_ASSERT(s.display_series.size() == 28, "display size");
    TEST_ASSERT(s.display_series.back() == 0.5, "last value");
    TEST_ASSERT(s.trend_sign == 1, "trend sign");
    TEST_ASSERT(double_eq(s.historical_center, 0.7), "historical centre");

    return true;
}

// Test: Price does not change seed-derived parameters or the jitter scale
bool test_price_independent_parameters()
{
    const Series_generator gen;
    const auto high = gen.generate("mkt-3", 0.9, Time_scale::D1);
    const auto low  = gen.generate("mkt-3", 0.1, Time_scale::D1);

    TEST_ASSERT(high.seed == low.seed, "seed");
    TEST_ASSERT(high.historical_bias == low.historical_bias, "bias");
    TEST_ASSERT(high.trend_sign == low.trend_sign, "trend");
    TEST_ASSERT(high.display_series.back() == 0.9, "high last");
    TEST_ASSERT(low.display_series.back() == 0.1, "low last");

    // Jitter steps move by at most half the jitter amplitude in both series
    const double max_jitter = constants::k_jitter_amp / 2.0 + 1e-12;
    for (int i = 1; i < 200; ++i) {
        if (Series_generator::step_kind_for_index(i) != Step_kind::JITTER_STEP) {
            continue;
        }
        const double dh = std::abs(high.base_series[i] - high.base_series[i - 1]);
        const double dl = std::abs(low.base_series[i] - low.base_series[i - 1]);
        TEST_ASSERT(dh <= max_jitter, "high jitter at " << i);
        TEST_ASSERT(dl <= max_jitter, "low jitter at " << i);
    }
    return true;
}

// Test: Resampling a linear ramp stays linear
bool test_resample_linear()
{
    std::vector<double> ramp(289);
    for (std::size_t i = 0; i < ramp.size(); ++i) {
        ramp[i] = static_cast<double>(i) / 288.0;
    }

    const auto out = Series_generator::resample_window(ramp, 0.75, 5, 1.0);
    TEST_ASSERT(out.size() == 5, "size");
    TEST_ASSERT(double_eq(out[0], 0.75, 1e-9), "first");
    TEST_ASSERT(double_eq(out[1], 0.8125, 1e-9), "second");
    TEST_ASSERT(double_eq(out[2], 0.875, 1e-9), "middle");
    TEST_ASSERT(out[4] == 1.0, "last pinned");

    TEST_ASSERT(Series_generator::resample_window(ramp, 0.5, 0, 0.5).empty(), "zero count");
    TEST_ASSERT(Series_generator::resample_window({}, 0.5, 4, 0.5).empty(), "empty base");

    return true;
}

// Test: Anchor stays inside bounds even for extreme centres
bool test_anchor_bounds()
{
    for (int i = 0; i <= 288; ++i) {
        const double t = i / 288.0;
        const double a = Series_generator::anchor_at(t, 0.98, 0.98, 11);
        const double b = Series_generator::anchor_at(t, 0.02, 0.02, 11);
        TEST_ASSERT(a >= 0.02 && a <= 0.98, "upper anchor");
        TEST_ASSERT(b >= 0.02 && b <= 0.98, "lower anchor");
    }
    return true;
}

} // anonymous namespace

int main()
{
    std::cout << "Series Generator Test Suite\n";
    std::cout << "===========================\n\n";

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_lcg_reference_sequence);
    RUN_TEST(test_lcg_range);
    RUN_TEST(test_derive_seed);
    RUN_TEST(test_seed_parameters);
    RUN_TEST(test_transition_weight);
    RUN_TEST(test_step_kinds);
    RUN_TEST(test_determinism);
    RUN_TEST(test_last_value_pinned);
    RUN_TEST(test_values_bounded);
    RUN_TEST(test_scale_windows);
    RUN_TEST(test_mkt3_one_hour);
    RUN_TEST(test_price_independent_parameters);
    RUN_TEST(test_resample_linear);
    RUN_TEST(test_anchor_bounds);

    std::cout << "\n===========================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";

    return failed > 0 ? 1 : 0;
}
