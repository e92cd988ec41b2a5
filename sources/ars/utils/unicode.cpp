//
// Created by gregorian-rayne on 10/20/26.
//

#include "ars/utils/unicode.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace ars::unicode
{
    namespace {

        struct Range {
            char32_t first;
            char32_t last;
        };

        // Non-ASCII code points that are neither letters nor digits. Sorted.
        constexpr std::array<Range, 33> NON_WORD_RANGES{{
            {0x0080, 0x00A9},   // C1 controls, Latin-1 punctuation
            {0x00AB, 0x00B1},
            {0x00B4, 0x00B4},
            {0x00B6, 0x00B8},
            {0x00BB, 0x00BB},
            {0x00BF, 0x00BF},
            {0x00D7, 0x00D7},
            {0x00F7, 0x00F7},
            {0x02C2, 0x02C5},   // modifier symbols
            {0x02D2, 0x02DF},
            {0x0300, 0x036F},   // combining diacritical marks
            {0x1680, 0x1680},
            {0x2000, 0x206F},   // general punctuation
            {0x20A0, 0x20FF},   // currency, combining marks for symbols
            {0x2190, 0x23FF},   // arrows, mathematical operators, technical
            {0x2500, 0x2775},   // box drawing .. dingbats
            {0x2794, 0x27FF},
            {0x2900, 0x2BFF},
            {0x2E00, 0x2E7F},   // supplemental punctuation
            {0x3000, 0x3004},   // CJK symbols and punctuation
            {0x3008, 0x3020},
            {0xD800, 0xDFFF},   // surrogates
            {0xE000, 0xF8FF},   // private use
            {0xFE00, 0xFE0F},   // variation selectors
            {0xFE10, 0xFE19},
            {0xFE30, 0xFE6F},
            {0xFEFF, 0xFEFF},
            {0xFF01, 0xFF0F},   // fullwidth ASCII punctuation
            {0xFF1A, 0xFF20},
            {0xFF3B, 0xFF40},
            {0xFF5B, 0xFF65},
            {0xFFF0, 0xFFFF},   // specials
            {0x1F300, 0x1FAFF}, // pictographs, emoji
        }};

        constexpr bool is_continuation(const unsigned char byte) noexcept {
            return (byte & 0xC0) == 0x80;
        }

        constexpr bool is_ascii_alnum(const char32_t c) noexcept {
            return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        constexpr char to_upper_ascii(const char c) noexcept {
            return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
        }

    }  // namespace

    CodePoint decode(std::string_view text, const std::size_t offset) noexcept {
        if (offset >= text.size()) {
            return {};
        }

        const auto lead = static_cast<unsigned char>(text[offset]);
        if (lead < 0x80) {
            return {lead, 1};
        }

        std::size_t length = 0;
        char32_t value = 0;
        char32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            value = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            value = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            value = lead & 0x07;
            minimum = 0x10000;
        } else {
            return {REPLACEMENT_CHARACTER, 1};
        }

        if (text.size() - offset < length) {
            return {REPLACEMENT_CHARACTER, 1};
        }
        for (std::size_t i = 1; i < length; ++i) {
            const auto byte = static_cast<unsigned char>(text[offset + i]);
            if (!is_continuation(byte)) {
                return {REPLACEMENT_CHARACTER, 1};
            }
            value = (value << 6) | (byte & 0x3F);
        }

        if (value < minimum || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
            return {REPLACEMENT_CHARACTER, 1};
        }
        return {value, length};
    }

    CodePoint decode_before(std::string_view text, const std::size_t offset) noexcept {
        if (offset == 0 || offset > text.size()) {
            return {};
        }

        std::size_t start = offset - 1;
        while (start > 0 && offset - start < 4 && is_continuation(static_cast<unsigned char>(text[start]))) {
            --start;
        }

        const auto code_point = decode(text, start);
        if (start + code_point.length != offset) {
            return {REPLACEMENT_CHARACTER, 1};
        }
        return code_point;
    }

    bool is_space(const char32_t c) noexcept {
        switch (c) {
            case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
            case 0x1C: case 0x1D: case 0x1E: case 0x1F:
            case 0x20:
            case 0x85: case 0xA0:
            case 0x1680:
            case 0x2028: case 0x2029:
            case 0x202F: case 0x205F:
            case 0x3000:
                return true;
            default:
                return c >= 0x2000 && c <= 0x200A;
        }
    }

    bool is_word(const char32_t c) noexcept {
        if (c < 0x80) {
            return is_ascii_alnum(c) || c == '_';
        }
        if (c > 0x10FFFF) {
            return false;
        }

        const auto it = std::upper_bound(
            NON_WORD_RANGES.begin(), NON_WORD_RANGES.end(), c,
            [](const char32_t value, const Range& range) { return value < range.first; }
        );
        if (it == NON_WORD_RANGES.begin()) {
            return true;
        }
        return c > std::prev(it)->last;
    }

    bool equals_ignore_case(const char32_t c, const char keyword) noexcept {
        const char upper = to_upper_ascii(keyword);
        if (upper < 'A' || upper > 'Z') {
            return c == static_cast<unsigned char>(keyword);
        }

        const auto lower = static_cast<char32_t>(upper - 'A' + 'a');
        if (c == static_cast<char32_t>(upper) || c == lower) {
            return true;
        }

        switch (upper) {
            case 'I': return c == 0x0130 || c == 0x0131;
            case 'S': return c == 0x017F;
            case 'K': return c == 0x212A;
            default:  return false;
        }
    }

    bool at_word_boundary(std::string_view text, const std::size_t offset) noexcept {
        const auto before = decode_before(text, offset);
        const auto after = decode(text, offset);

        const bool word_before = before.length > 0 && is_word(before.value);
        const bool word_after = after.length > 0 && is_word(after.value);
        return word_before != word_after;
    }
}  // namespace ars::unicode
