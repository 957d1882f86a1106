#pragma once

// odds_chart - Configuration
// Injectable configuration for application-specific behavior.
// Lets the core run headless while the host application supplies
// time formatting, logging and profiling.

#include <cstddef>
#include <ctime>
#include <functional>
#include <memory>
#include <string>

namespace odds::chart {

// -----------------------------------------------------------------------------
// Profiling Interface (optional)
// -----------------------------------------------------------------------------
// Applications can inject profiling by implementing this interface.
// If not provided, profiling is a no-op.
class Profiler
{
public:
    virtual ~Profiler() = default;
    virtual void begin_scope(const char* name) = 0;
    virtual void end_scope() = 0;
};

// RAII scope guard for profiling
class Profile_scope
{
public:
    Profile_scope(Profiler* profiler, const char* name)
    :
        m_profiler(profiler)
    {
        if (m_profiler) {
            m_profiler->begin_scope(name);
        }
    }

    ~Profile_scope()
    {
        if (m_profiler) {
            m_profiler->end_scope();
        }
    }

    Profile_scope(const Profile_scope&) = delete;
    Profile_scope& operator=(const Profile_scope&) = delete;

private:
    Profiler* m_profiler;
};

// Macro helpers for proper __LINE__ expansion
#define ODDS_CHART_CONCAT_IMPL(a, b) a##b
#define ODDS_CHART_CONCAT(a, b) ODDS_CHART_CONCAT_IMPL(a, b)

// Macro for scoped profiling (no-op if profiler is null)
#define ODDS_CHART_PROFILE_SCOPE(profiler, name) \
    ::odds::chart::Profile_scope ODDS_CHART_CONCAT(odds_chart_profile_scope_, __LINE__)((profiler), (name))

// -----------------------------------------------------------------------------
// Default Timestamp Formatters
// -----------------------------------------------------------------------------
// UTC strftime based. Applications that need the exchange time zone
// install their own (see qt/et_time_format.h).
inline std::string format_utc(double timestamp, const char* pattern)
{
    time_t t = static_cast<time_t>(timestamp);
    struct tm tm_buf;

#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif

    char buf[48];
    const std::size_t n = std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf, n);
}

inline std::string default_format_axis_time(double timestamp)
{
    return format_utc(timestamp, "%H:%M");
}

inline std::string default_format_hover_time(double timestamp)
{
    return format_utc(timestamp, "%b %d, %H:%M");
}

// -----------------------------------------------------------------------------
// Chart Configuration
// -----------------------------------------------------------------------------
struct Chart_config
{
    // --- Timestamp Formatting ---
    // Unix seconds -> text for the axis ticks and the hover tooltip.
    // If null, the UTC defaults above are used.
    std::function<std::string(double timestamp)> format_axis_time;
    std::function<std::string(double timestamp)> format_hover_time;

    // --- Profiling (optional) ---
    std::shared_ptr<Profiler> profiler;

    // --- Logging (optional) ---
    std::function<void(const std::string&)> log_debug;
    std::function<void(const std::string&)> log_error;

    // --- Series cache ---
    // 0 disables memoisation of generated series.
    std::size_t series_cache_capacity = 64;

    static Chart_config make_default()
    {
        Chart_config cfg;
        cfg.format_axis_time  = &default_format_axis_time;
        cfg.format_hover_time = &default_format_hover_time;
        cfg.series_cache_capacity = 64;
        return cfg;
    }
};

} // namespace odds::chart
