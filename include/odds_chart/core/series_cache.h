#pragma once

// odds_chart - Series Cache
// Memoises generated series per (market id, price, scale). Generation is a
// pure function of the key, so a hit is bit-identical to a fresh result.

#include "series_generator.h"
#include "types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace odds::chart {

// -----------------------------------------------------------------------------
// Series Cache Key
// -----------------------------------------------------------------------------
struct series_cache_key_t
{
    std::string   market_id;
    std::uint64_t probability_bits = 0;
    Time_scale    scale            = Time_scale::D1;

    static series_cache_key_t make(std::string_view market_id, double probability, Time_scale scale)
    {
        series_cache_key_t key;
        key.market_id = std::string(market_id);
        std::memcpy(&key.probability_bits, &probability, sizeof(key.probability_bits));
        key.scale = scale;
        return key;
    }

    [[nodiscard]] bool operator==(const series_cache_key_t& other) const noexcept
    {
        return probability_bits == other.probability_bits &&
               scale == other.scale &&
               market_id == other.market_id;
    }

    [[nodiscard]] bool operator!=(const series_cache_key_t& other) const noexcept
    {
        return !(*this == other);
    }
};

struct series_cache_key_hash_t
{
    std::size_t operator()(const series_cache_key_t& key) const noexcept
    {
        std::size_t h = std::hash<std::string>{}(key.market_id);
        h ^= std::hash<std::uint64_t>{}(key.probability_bits) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        h ^= static_cast<std::size_t>(key.scale) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};

// -----------------------------------------------------------------------------
// Series Cache
// -----------------------------------------------------------------------------
// Bounded; the least recently used entry is evicted first.
class Series_cache
{
public:
    using key_t      = series_cache_key_t;
    using value_type = generated_series_t;

    explicit Series_cache(std::size_t capacity = 64)
    :
        m_capacity(capacity)
    {}

    [[nodiscard]] const value_type* try_get(const key_t& query)
    {
        const auto it = m_entries.find(query);
        if (it == m_entries.end()) {
            return nullptr;
        }
        touch(query);
        return &it->second;
    }

    const value_type& store(const key_t& key, value_type&& value)
    {
        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            it->second = std::move(value);
            touch(key);
            return it->second;
        }

        if (m_capacity > 0 && m_entries.size() >= m_capacity && !m_lru.empty()) {
            m_entries.erase(m_lru.front());
            m_lru.erase(m_lru.begin());
        }
        it = m_entries.emplace(key, std::move(value)).first;
        m_lru.push_back(key);
        return it->second;
    }

    void invalidate() noexcept
    {
        m_entries.clear();
        m_lru.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

private:
    void touch(const key_t& key)
    {
        auto pos = std::find(m_lru.begin(), m_lru.end(), key);
        if (pos != m_lru.end() && std::next(pos) != m_lru.end()) {
            key_t moved = *pos;
            m_lru.erase(pos);
            m_lru.push_back(std::move(moved));
        }
    }

    std::size_t m_capacity;
    std::unordered_map<key_t, value_type, series_cache_key_hash_t> m_entries;
    std::vector<key_t> m_lru;
};

} // namespace odds::chart
