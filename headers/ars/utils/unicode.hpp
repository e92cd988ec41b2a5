//
// Created by gregorian-rayne on 10/20/26.
//

#ifndef ARS_UNICODE_HPP
#define ARS_UNICODE_HPP

/**
 * @file unicode.hpp
 * @brief UTF-8 decoding and the character classes the rules match with.
 *
 * Unit source arrives as UTF-8. Word boundaries, whitespace runs and
 * case-insensitive keyword comparison are decided per code point, so an
 * identifier such as lv_ärger is one word and BREAK-POINT inside it is not
 * a statement.
 */

#include <cstddef>
#include <string_view>

namespace ars::unicode {

    inline constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

    /**
     * A decoded code point and the number of bytes it occupies.
     *
     * length is 0 only when there is nothing to decode (offset at either
     * end of the text). A malformed sequence decodes as one byte of
     * REPLACEMENT_CHARACTER.
     */
    struct CodePoint {
        char32_t value = 0;
        std::size_t length = 0;
    };

    /**
     * Decodes the code point starting at offset.
     */
    [[nodiscard]] CodePoint decode(std::string_view text, std::size_t offset) noexcept;

    /**
     * Decodes the code point that ends right before offset.
     */
    [[nodiscard]] CodePoint decode_before(std::string_view text, std::size_t offset) noexcept;

    /**
     * ASCII whitespace, the information separators U+001C..U+001F and the
     * Unicode space separators and line/paragraph separators.
     */
    [[nodiscard]] bool is_space(char32_t c) noexcept;

    /**
     * Letters and digits of any script, plus the underscore.
     *
     * Outside ASCII a code point counts as a word character unless it is a
     * space, a control, a combining mark or falls in one of the punctuation
     * and symbol blocks.
     */
    [[nodiscard]] bool is_word(char32_t c) noexcept;

    /**
     * True when c matches the ASCII character keyword ignoring case.
     *
     * Besides the two ASCII cases this accepts the code points that fold
     * to the same letter: U+0130 and U+0131 for I, U+017F for S and the
     * Kelvin sign U+212A for K.
     */
    [[nodiscard]] bool equals_ignore_case(char32_t c, char keyword) noexcept;

    /**
     * True when offset lies between a word and a non-word character. The
     * start and end of text count as non-word.
     */
    [[nodiscard]] bool at_word_boundary(std::string_view text, std::size_t offset) noexcept;

}  // namespace ars::unicode

#endif //ARS_UNICODE_HPP
