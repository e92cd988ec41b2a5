//
// Created by gregorian-rayne on 10/03/26.
//

#ifndef ARS_RULE_HPP
#define ARS_RULE_HPP

/**
 * @file rule.hpp
 * @brief Rule interface and the immutable rule set.
 *
 * A rule recognizes one forbidden or obsolete ABAP statement in a block of
 * text. Rules are stateless and thread-safe; the same instance scans every
 * unit. How a rule matches (regular expression, hand-written scanner) is
 * hidden behind IRule so the finding builder only ever sees MatchSpans.
 *
 * Built-in rules:
 * - Rule303_SetExtendedCheck: obsolete SET EXTENDED CHECK
 * - Rule304_BreakPointUsage: BREAK-POINT with an optional argument
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ars::rules {

    /**
     * One match, as offsets local to the scanned text.
     *
     * start is inclusive, end exclusive. text is the exact matched substring.
     */
    struct MatchSpan {
        std::size_t start = 0;
        std::size_t end = 0;
        std::string text;

        bool operator==(const MatchSpan&) const = default;
    };

    /**
     * Receives matches in left-to-right order while a rule scans.
     */
    using MatchVisitor = std::function<void(const MatchSpan&)>;

    /**
     * Interface for statement rules.
     */
    class IRule {
    public:
        virtual ~IRule() = default;

        /**
         * Returns the rule identifier, e.g. "Rule303_SetExtendedCheck".
         * It is reported as the finding's issues_type.
         */
        [[nodiscard]] virtual std::string_view id() const noexcept = 0;

        /**
         * Returns the rule number reported by the health probe.
         */
        [[nodiscard]] virtual int number() const noexcept = 0;

        [[nodiscard]] virtual std::string_view message() const noexcept = 0;

        [[nodiscard]] virtual std::string_view suggestion() const noexcept = 0;

        /**
         * Scans text and hands each non-overlapping match to visitor as it
         * is found. Calling it again on the same text restarts the scan and
         * yields the same matches.
         *
         * @param text Unit source; may be empty or contain any characters.
         * @param visitor Called once per match, leftmost first.
         */
        virtual void scan(std::string_view text, const MatchVisitor& visitor) const = 0;

        /**
         * Collects every match of scan() into a vector.
         */
        [[nodiscard]] std::vector<MatchSpan> find_all(std::string_view text) const;
    };

    /**
     * Ordered, immutable collection of active rules.
     *
     * Built once at startup and passed by reference to whoever scans.
     * Registration order is the order findings appear in a scanned unit.
     */
    class RuleSet {
    public:
        using Rules = std::vector<std::shared_ptr<const IRule>>;

        RuleSet() = default;
        explicit RuleSet(Rules rules);

        [[nodiscard]] const Rules& rules() const noexcept {
            return rules_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return rules_.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return rules_.empty();
        }

        /**
         * Looks a rule up by its identifier.
         *
         * @return The rule, or nullptr if none has that id.
         */
        [[nodiscard]] const IRule* find(std::string_view id) const;

        /**
         * Returns the rule numbers in registration order.
         */
        [[nodiscard]] std::vector<int> numbers() const;

        /**
         * Returns a rule set holding only the rules whose id is listed,
         * keeping this set's order. Unknown ids are ignored.
         */
        [[nodiscard]] RuleSet select(const std::vector<std::string>& ids) const;

    private:
        Rules rules_;
    };

}  // namespace ars::rules

#endif //ARS_RULE_HPP
