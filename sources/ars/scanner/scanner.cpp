//
// Created by gregorian-rayne on 10/04/26.
//

#include "ars/scanner/scanner.hpp"
#include "ars/scanner/finding_builder.hpp"

#include <utility>

namespace ars::scanner
{
    namespace {

        std::vector<Unit> apply_mode(std::vector<Unit> scanned, const BatchMode mode) {
            if (mode == BatchMode::FindingsOnly) {
                std::erase_if(scanned, [](const Unit& unit) {
                    return !unit.has_findings();
                });
            }
            return scanned;
        }

    }  // namespace

    Unit Scanner::scan_one(const Unit& unit) const {
        std::vector<Finding> findings;

        for (const auto& rule : rules_.rules()) {
            rule->scan(unit.code, [&](const rules::MatchSpan& match) {
                findings.push_back(build_finding(unit, *rule, match));
            });
        }

        Unit result = unit;
        if (findings.empty()) {
            result.findings.reset();
        } else {
            result.findings = std::move(findings);
        }
        return result;
    }

    std::vector<Unit> Scanner::scan_many(
        const std::vector<Unit>& units,
        const BatchMode mode
    ) const {
        std::vector<Unit> scanned;
        scanned.reserve(units.size());

        for (const auto& unit : units) {
            scanned.push_back(scan_one(unit));
        }

        return apply_mode(std::move(scanned), mode);
    }

    std::vector<Unit> Scanner::scan_many(
        const std::vector<Unit>& units,
        const BatchMode mode,
        parallel::ThreadPool& pool
    ) const {
        auto scanned = parallel::map(units, [this](const Unit& unit) {
            return scan_one(unit);
        }, pool);

        return apply_mode(std::move(scanned), mode);
    }

    ScanSummary summarize(const std::vector<Unit>& units) {
        ScanSummary summary;
        summary.units_scanned = units.size();

        for (const auto& unit : units) {
            if (!unit.has_findings()) {
                continue;
            }

            ++summary.units_with_findings;
            summary.total_findings += unit.findings->size();

            for (const auto& finding : *unit.findings) {
                ++summary.findings_by_rule[finding.issues_type];
            }
        }

        return summary;
    }
}  // namespace ars::scanner
