#pragma once

// odds_chart - UTF-8 Utilities
// Decoding helpers that reproduce UTF-16 string semantics (code unit
// sums and lengths) on UTF-8 input.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace odds::chart::detail {

// Decode a single UTF-8 code point from a string.
// Returns the code point and advances the iterator.
// Returns 0xFFFD (replacement character) on invalid sequences.
[[nodiscard]]
char32_t utf8_decode_one(const char*& it, const char* end) noexcept;

// Sum of the UTF-16 code units that encode the string.
// Supplementary-plane code points contribute both surrogates.
[[nodiscard]]
std::uint64_t utf16_unit_sum(std::string_view utf8) noexcept;

// Number of UTF-16 code units needed to encode the string.
[[nodiscard]]
std::size_t utf16_length(std::string_view utf8) noexcept;

} // namespace odds::chart::detail
