//
// Created by gregorian-rayne on 10/03/26.
//

#ifndef ARS_KEYWORD_RULE_HPP
#define ARS_KEYWORD_RULE_HPP

/**
 * @file keyword_rule.hpp
 * @brief Rule that recognizes a fixed phrase of ABAP keywords.
 *
 * The phrase is matched case-insensitively with one or more whitespace
 * characters between keywords and a word boundary on both ends. With
 * trailing_word set, whitespace followed by one more word is consumed into
 * the match when present.
 *
 * The scanner works directly on the UTF-8 text and never backtracks more
 * than one phrase, so a scan is linear in the text length however long a
 * whitespace run or identifier is.
 */

#include "ars/rules/rule.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ars::rules {

    struct KeywordRuleSpec {
        std::string id;
        int number = 0;
        std::vector<std::string> keywords;  ///< ASCII, e.g. {"SET", "EXTENDED", "CHECK"}
        bool trailing_word = false;
        std::string message;
        std::string suggestion;
    };

    class KeywordRule final : public IRule {
    public:
        /**
         * @throws std::invalid_argument if keywords is empty or holds an
         *         empty or non-ASCII keyword.
         */
        explicit KeywordRule(KeywordRuleSpec spec);

        [[nodiscard]] std::string_view id() const noexcept override { return spec_.id; }
        [[nodiscard]] int number() const noexcept override { return spec_.number; }
        [[nodiscard]] std::string_view message() const noexcept override { return spec_.message; }
        [[nodiscard]] std::string_view suggestion() const noexcept override { return spec_.suggestion; }

        [[nodiscard]] const std::vector<std::string>& keywords() const noexcept { return spec_.keywords; }

        void scan(std::string_view text, const MatchVisitor& visitor) const override;

    private:
        /**
         * End offset of a match starting exactly at offset, if there is one.
         */
        [[nodiscard]] std::optional<std::size_t> match_at(std::string_view text, std::size_t offset) const;

        KeywordRuleSpec spec_;
    };

}  // namespace ars::rules

#endif //ARS_KEYWORD_RULE_HPP
