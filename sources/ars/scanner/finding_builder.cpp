//
// Created by gregorian-rayne on 10/04/26.
//

#include "ars/scanner/finding_builder.hpp"

#include <algorithm>
#include <limits>

namespace ars::scanner
{
    std::int64_t line_in_block(std::string_view text, std::size_t offset) noexcept {
        const auto head = text.substr(0, std::min(offset, text.size()));
        return static_cast<std::int64_t>(std::ranges::count(head, '\n')) + 1;
    }

    std::string_view extract_line(std::string_view text, std::size_t offset) noexcept {
        offset = std::min(offset, text.size());

        std::size_t line_start = 0;
        if (offset > 0) {
            if (const auto prev = text.rfind('\n', offset - 1); prev != std::string_view::npos) {
                line_start = prev + 1;
            }
        }

        auto line_end = text.find('\n', offset);
        if (line_end == std::string_view::npos) {
            line_end = text.size();
        }

        return text.substr(line_start, line_end - line_start);
    }

    std::string escape_line_breaks(std::string_view line) {
        std::string escaped;
        escaped.reserve(line.size());

        for (const char c : line) {
            if (c == '\n') {
                escaped += "\\n";
            } else {
                escaped += c;
            }
        }

        return escaped;
    }

    Finding build_finding(
        const Unit& unit,
        const rules::IRule& rule,
        const rules::MatchSpan& match
    ) {
        const std::string_view code = unit.code;
        const auto in_block = line_in_block(code, match.start);

        // Saturates instead of overflowing for start_line near INT64_MAX.
        constexpr auto max_line = std::numeric_limits<std::int64_t>::max();
        const auto absolute_line = unit.start_line > max_line - in_block
            ? max_line
            : unit.start_line + in_block;

        Finding finding;
        finding.prog_name = unit.pgm_name;
        finding.incl_name = unit.inc_name;
        finding.types = unit.type;
        finding.blockname = unit.name;
        finding.starting_line = absolute_line;
        finding.ending_line = absolute_line;
        finding.issues_type = std::string(rule.id());
        finding.severity = Severity::Error;
        finding.message = std::string(rule.message());
        finding.suggestion = std::string(rule.suggestion());
        finding.snippet = escape_line_breaks(extract_line(code, match.start));

        return finding;
    }
}  // namespace ars::scanner
