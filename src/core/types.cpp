#include <odds_chart/core/types.h>

#include <array>

namespace odds::chart {

std::optional<Time_scale> parse_time_scale(std::string_view key) noexcept
{
    static constexpr std::array<Time_scale, 5> k_all{
        Time_scale::H1, Time_scale::H3, Time_scale::H6, Time_scale::H12, Time_scale::D1
    };
    for (const Time_scale scale : k_all) {
        if (key == time_scale_key(scale)) {
            return scale;
        }
    }
    return std::nullopt;
}

} // namespace odds::chart
