//
// Created by gregorian-rayne on 10/03/26.
//

#include "ars/rules/rule.hpp"

#include <algorithm>
#include <utility>

namespace ars::rules
{
    std::vector<MatchSpan> IRule::find_all(std::string_view text) const {
        std::vector<MatchSpan> matches;
        scan(text, [&matches](const MatchSpan& span) {
            matches.push_back(span);
        });
        return matches;
    }

    RuleSet::RuleSet(Rules rules)
        : rules_(std::move(rules)) {
        std::erase(rules_, nullptr);
    }

    const IRule* RuleSet::find(std::string_view id) const {
        const auto it = std::ranges::find_if(rules_, [id](const auto& rule) {
            return rule->id() == id;
        });
        return it != rules_.end() ? it->get() : nullptr;
    }

    std::vector<int> RuleSet::numbers() const {
        std::vector<int> result;
        result.reserve(rules_.size());

        for (const auto& rule : rules_) {
            result.push_back(rule->number());
        }

        return result;
    }

    RuleSet RuleSet::select(const std::vector<std::string>& ids) const {
        Rules selected;
        for (const auto& rule : rules_) {
            if (std::ranges::find(ids, rule->id()) != ids.end()) {
                selected.push_back(rule);
            }
        }
        return RuleSet(std::move(selected));
    }
}  // namespace ars::rules
