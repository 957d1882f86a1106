#include "utf8_utils.h"

namespace odds::chart::detail {

namespace {

constexpr char32_t k_replacement_char = 0xFFFD;

// Check if byte is a UTF-8 continuation byte (10xxxxxx)
constexpr bool is_continuation(unsigned char c) noexcept
{
    return (c & 0xC0) == 0x80;
}

template<typename Fn>
void for_each_codepoint(std::string_view utf8, Fn&& fn)
{
    const char* it = utf8.data();
    const char* end = it + utf8.size();

    while (it < end) {
        fn(utf8_decode_one(it, end));
    }
}

} // anonymous namespace

char32_t utf8_decode_one(const char*& it, const char* end) noexcept
{
    if (it >= end) {
        return k_replacement_char;
    }

    const auto* p = reinterpret_cast<const unsigned char*>(it);
    const unsigned char c0 = *p++;

    // ASCII (0xxxxxxx)
    if ((c0 & 0x80) == 0) {
        it = reinterpret_cast<const char*>(p);
        return static_cast<char32_t>(c0);
    }

    std::size_t seq_len;
    char32_t cp;

    if ((c0 & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = c0 & 0x1F;
    }
    else if ((c0 & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = c0 & 0x0F;
    }
    else if ((c0 & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = c0 & 0x07;
    }
    else {
        it = reinterpret_cast<const char*>(p);
        return k_replacement_char;
    }

    const auto* seq_end = reinterpret_cast<const unsigned char*>(end);
    if (p + seq_len - 1 > seq_end) {
        it = end;
        return k_replacement_char;
    }

    for (std::size_t i = 1; i < seq_len; ++i) {
        if (!is_continuation(*p)) {
            it = reinterpret_cast<const char*>(p);
            return k_replacement_char;
        }
        cp = (cp << 6) | (*p++ & 0x3F);
    }

    it = reinterpret_cast<const char*>(p);

    // Overlong encodings, surrogates and out-of-range values
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000) ||
        cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
        return k_replacement_char;
    }

    return cp;
}

std::uint64_t utf16_unit_sum(std::string_view utf8) noexcept
{
    std::uint64_t sum = 0;
    for_each_codepoint(utf8, [&sum](char32_t cp) {
        if (cp < 0x10000) {
            sum += cp;
            return;
        }
        const char32_t v = cp - 0x10000;
        sum += 0xD800 + (v >> 10);
        sum += 0xDC00 + (v & 0x3FF);
    });
    return sum;
}

std::size_t utf16_length(std::string_view utf8) noexcept
{
    std::size_t count = 0;
    for_each_codepoint(utf8, [&count](char32_t cp) {
        count += (cp < 0x10000) ? 1 : 2;
    });
    return count;
}

} // namespace odds::chart::detail
