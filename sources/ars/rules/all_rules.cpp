//
// Created by gregorian-rayne on 10/03/26.
//

#include "ars/rules/all_rules.hpp"

namespace ars::rules
{
    std::shared_ptr<const IRule> make_set_extended_check_rule() {
        return std::make_shared<KeywordRule>(KeywordRuleSpec{
            .id = SET_EXTENDED_CHECK_ID,
            .number = 303,
            .keywords = {"SET", "EXTENDED", "CHECK"},
            .message = "Obsolete SET EXTENDED CHECK statement detected.",
            .suggestion = "Remove the SET EXTENDED CHECK statement entirely."
        });
    }

    std::shared_ptr<const IRule> make_break_point_rule() {
        // The optional word covers BREAK-POINT ID <group> and BREAK-POINT <var>.
        return std::make_shared<KeywordRule>(KeywordRuleSpec{
            .id = BREAK_POINT_ID,
            .number = 304,
            .keywords = {"BREAK-POINT"},
            .trailing_word = true,
            .message = "BREAK-POINT is not allowed in ABAP Cloud / Key User scenarios.",
            .suggestion = "Remove or comment out the BREAK-POINT statement."
        });
    }

    RuleSet default_rule_set() {
        return RuleSet({
            make_set_extended_check_rule(),
            make_break_point_rule()
        });
    }
}  // namespace ars::rules
