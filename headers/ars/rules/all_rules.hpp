//
// Created by gregorian-rayne on 10/03/26.
//

#ifndef ARS_ALL_RULES_HPP
#define ARS_ALL_RULES_HPP

/**
 * @file all_rules.hpp
 * @brief Built-in rules and the default rule set.
 */

#include "ars/rules/rule.hpp"
#include "ars/rules/keyword_rule.hpp"

#include <memory>

namespace ars::rules {

    inline constexpr auto SET_EXTENDED_CHECK_ID = "Rule303_SetExtendedCheck";
    inline constexpr auto BREAK_POINT_ID = "Rule304_BreakPointUsage";

    /**
     * SET EXTENDED CHECK with any whitespace between the keywords.
     */
    [[nodiscard]] std::shared_ptr<const IRule> make_set_extended_check_rule();

    /**
     * BREAK-POINT, optionally followed by one argument word
     * (BREAK-POINT ID group, BREAK-POINT lv_flag).
     */
    [[nodiscard]] std::shared_ptr<const IRule> make_break_point_rule();

    /**
     * All built-in rules in reporting order: Rule303 then Rule304.
     */
    [[nodiscard]] RuleSet default_rule_set();

}  // namespace ars::rules

#endif //ARS_ALL_RULES_HPP
