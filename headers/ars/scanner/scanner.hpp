//
// Created by gregorian-rayne on 10/04/26.
//

#ifndef ARS_SCANNER_HPP
#define ARS_SCANNER_HPP

/**
 * @file scanner.hpp
 * @brief Runs a rule set over units.
 *
 * The scanner is stateless apart from the rule set it borrows. scan_one()
 * never modifies its argument; it returns a copy of the unit with findings
 * attached, in rule registration order and, within a rule, in text order.
 * Units are independent of each other, so scan_many() may fan out over a
 * thread pool while keeping the input order.
 */

#include "ars/types.hpp"
#include "ars/rules/rule.hpp"
#include "ars/utils/parallel.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ars::scanner {

    /**
     * What scan_many() does with units that produced no findings.
     */
    enum class BatchMode {
        KeepAll,      ///< Return every unit, annotated or not
        FindingsOnly  ///< Drop units without findings
    };

    /**
     * Counters over a set of scanned units.
     */
    struct ScanSummary {
        std::size_t units_scanned = 0;
        std::size_t units_with_findings = 0;
        std::size_t total_findings = 0;
        std::map<std::string, std::size_t> findings_by_rule;
    };

    class Scanner {
    public:
        /**
         * @param rules Active rules. Must outlive the scanner.
         */
        explicit Scanner(const rules::RuleSet& rules) noexcept
            : rules_(rules) {}

        [[nodiscard]] const rules::RuleSet& rules() const noexcept {
            return rules_;
        }

        /**
         * Scans one unit.
         *
         * @return A copy of unit whose findings hold every match, or
         *         std::nullopt when no rule matched.
         */
        [[nodiscard]] Unit scan_one(const Unit& unit) const;

        /**
         * Scans each unit in order on the calling thread.
         */
        [[nodiscard]] std::vector<Unit> scan_many(
            const std::vector<Unit>& units,
            BatchMode mode = BatchMode::KeepAll
        ) const;

        /**
         * Scans units concurrently on pool. Output order matches input order.
         */
        [[nodiscard]] std::vector<Unit> scan_many(
            const std::vector<Unit>& units,
            BatchMode mode,
            parallel::ThreadPool& pool
        ) const;

    private:
        const rules::RuleSet& rules_;
    };

    /**
     * Counts units and findings, per rule id.
     */
    [[nodiscard]] ScanSummary summarize(const std::vector<Unit>& units);

}  // namespace ars::scanner

#endif //ARS_SCANNER_HPP
