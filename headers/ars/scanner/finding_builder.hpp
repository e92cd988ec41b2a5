//
// Created by gregorian-rayne on 10/04/26.
//

#ifndef ARS_FINDING_BUILDER_HPP
#define ARS_FINDING_BUILDER_HPP

/**
 * @file finding_builder.hpp
 * @brief Turns a rule match inside a unit into an absolute Finding.
 *
 * Line numbers reported downstream are computed as
 *
 *     starting_line = unit.start_line + (line breaks before match) + 1
 *
 * so a match on the first line of code is reported at start_line + 1.
 * Consumers of the reports rely on this arithmetic; do not change it.
 */

#include "ars/types.hpp"
#include "ars/rules/rule.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ars::scanner {

    /**
     * Returns the 1-based line within text on which offset lies, counting
     * '\n' characters strictly before offset.
     */
    [[nodiscard]] std::int64_t line_in_block(std::string_view text, std::size_t offset) noexcept;

    /**
     * Returns the physical line containing offset, without its line break.
     */
    [[nodiscard]] std::string_view extract_line(std::string_view text, std::size_t offset) noexcept;

    /**
     * Replaces every '\n' with the two characters "\\n".
     */
    [[nodiscard]] std::string escape_line_breaks(std::string_view line);

    /**
     * Builds the finding for one match of rule inside unit.code.
     *
     * @param unit Owning unit; provides context fields and start_line.
     * @param rule The rule that matched; provides id, message, suggestion.
     * @param match Offsets local to unit.code. start must be <= code size.
     */
    [[nodiscard]] Finding build_finding(
        const Unit& unit,
        const rules::IRule& rule,
        const rules::MatchSpan& match
    );

}  // namespace ars::scanner

#endif //ARS_FINDING_BUILDER_HPP
