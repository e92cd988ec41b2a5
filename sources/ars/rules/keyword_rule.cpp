//
// Created by gregorian-rayne on 10/03/26.
//

#include "ars/rules/keyword_rule.hpp"
#include "ars/utils/unicode.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace ars::rules
{
    namespace {

        /**
         * Offset just past the keyword if it is spelled at offset.
         */
        std::optional<std::size_t> match_keyword(std::string_view text, std::size_t offset, std::string_view keyword) {
            for (const char expected : keyword) {
                const auto c = unicode::decode(text, offset);
                if (c.length == 0 || !unicode::equals_ignore_case(c.value, expected)) {
                    return std::nullopt;
                }
                offset += c.length;
            }
            return offset;
        }

        std::size_t skip_while(std::string_view text, std::size_t offset, bool (*predicate)(char32_t) noexcept) {
            while (offset < text.size()) {
                const auto c = unicode::decode(text, offset);
                if (!predicate(c.value)) {
                    break;
                }
                offset += c.length;
            }
            return offset;
        }

    }  // namespace

    KeywordRule::KeywordRule(KeywordRuleSpec spec)
        : spec_(std::move(spec)) {
        if (spec_.keywords.empty()) {
            throw std::invalid_argument("Keyword rule " + spec_.id + " has no keywords");
        }
        for (const auto& keyword : spec_.keywords) {
            const bool ascii = std::ranges::all_of(keyword, [](const char c) {
                return static_cast<unsigned char>(c) < 0x80;
            });
            if (keyword.empty() || !ascii) {
                throw std::invalid_argument("Keyword rule " + spec_.id + " has an invalid keyword");
            }
        }
    }

    std::optional<std::size_t> KeywordRule::match_at(std::string_view text, std::size_t offset) const {
        if (!unicode::at_word_boundary(text, offset)) {
            return std::nullopt;
        }

        auto end = match_keyword(text, offset, spec_.keywords.front());
        for (std::size_t i = 1; end && i < spec_.keywords.size(); ++i) {
            const auto next = skip_while(text, *end, unicode::is_space);
            if (next == *end) {
                return std::nullopt;
            }
            end = match_keyword(text, next, spec_.keywords[i]);
        }

        if (!end || !unicode::at_word_boundary(text, *end)) {
            return std::nullopt;
        }

        if (spec_.trailing_word) {
            const auto word_start = skip_while(text, *end, unicode::is_space);
            const auto word_end = skip_while(text, word_start, unicode::is_word);
            if (word_start > *end && word_end > word_start) {
                end = word_end;
            }
        }

        return end;
    }

    void KeywordRule::scan(std::string_view text, const MatchVisitor& visitor) const {
        const char first = spec_.keywords.front().front();

        std::size_t offset = 0;
        while (offset < text.size()) {
            const auto c = unicode::decode(text, offset);

            if (unicode::equals_ignore_case(c.value, first)) {
                if (const auto end = match_at(text, offset)) {
                    visitor(MatchSpan{offset, *end, std::string(text.substr(offset, *end - offset))});
                    offset = *end;
                    continue;
                }
            }

            offset += c.length;
        }
    }
}  // namespace ars::rules
