//
// Created by gregorian-rayne on 10/02/26.
//

#ifndef ARS_TYPES_HPP
#define ARS_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures exchanged with the scanner.
 *
 * - Unit: one block of ABAP source with its absolute position in the file
 * - Finding: one rule violation located inside a Unit
 * - Severity: finding severity
 *
 * Field names follow the JSON wire format (see serialization/unit_codec.hpp)
 * so the mapping stays one-to-one.
 */

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ars {

    // ============================================================================
    // Findings
    // ============================================================================

    enum class Severity {
        Info,
        Warning,
        Error
    };

    /**
     * Returns the lowercase wire name ("info", "warning", "error").
     */
    [[nodiscard]] const char* to_string(Severity severity) noexcept;

    /**
     * One detected occurrence of a monitored statement.
     *
     * Context fields are copied from the owning Unit. For the single-line
     * rules starting_line always equals ending_line. The snippet is the
     * physical source line holding the match start and never contains a raw
     * line break.
     */
    struct Finding {
        std::string prog_name;
        std::string incl_name;
        std::string types;
        std::optional<std::string> blockname;
        std::int64_t starting_line = 0;
        std::int64_t ending_line = 0;
        std::string issues_type;
        Severity severity = Severity::Error;
        std::string message;
        std::string suggestion;
        std::string snippet;

        bool operator==(const Finding&) const = default;
    };

    // ============================================================================
    // Units
    // ============================================================================

    /**
     * A contiguous block of source produced by the upstream unit splitter.
     *
     * start_line is the absolute line the block is anchored at in its
     * containing include; the scanner adds the 1-based line within code to
     * it. start_line <= end_line is assumed, not checked.
     *
     * findings stays std::nullopt until a scan produces at least one finding.
     */
    struct Unit {
        std::string pgm_name;
        std::string inc_name;
        std::string type;
        std::optional<std::string> name = std::string{};
        std::optional<std::string> class_implementation;
        std::int64_t start_line = 0;
        std::int64_t end_line = 0;
        std::string code;
        std::optional<std::vector<Finding>> findings;

        [[nodiscard]] bool has_findings() const noexcept {
            return findings.has_value() && !findings->empty();
        }

        [[nodiscard]] std::size_t finding_count() const noexcept {
            return findings.has_value() ? findings->size() : 0;
        }

        bool operator==(const Unit&) const = default;
    };

}  // namespace ars

#endif //ARS_TYPES_HPP
