//
// Created by gregorian-rayne on 10/05/26.
//

#ifndef ARS_UNIT_CODEC_HPP
#define ARS_UNIT_CODEC_HPP

/**
 * @file unit_codec.hpp
 * @brief JSON encoding and validated decoding of Units and Findings.
 *
 * Unit object:
 * @code
 *     {
 *       "pgm_name": "ZREPORT",           // required string
 *       "inc_name": "ZREPORT_F01",       // required string
 *       "type": "method",                // required string
 *       "name": "GET_DATA",              // string or null, default ""
 *       "class_implementation": null,    // string or null
 *       "start_line": 120,               // integer, default 0
 *       "end_line": 140,                 // integer, default 0
 *       "code": "...",                   // string or null, default ""
 *       "findings": null                 // array of findings or null
 *     }
 * @endcode
 *
 * Finding object fields: prog_name, incl_name, types, blockname,
 * starting_line, ending_line, issues_type, severity, message, suggestion,
 * snippet. Absent optionals are encoded as null.
 *
 * Decoding errors are ParseError with the offending field path as context,
 * e.g. "[4].start_line".
 */

#include "ars/types.hpp"
#include "ars/result.hpp"
#include "ars/error.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace ars::codec {

    using json = nlohmann::json;

    [[nodiscard]] json encode_finding(const Finding& finding);

    [[nodiscard]] json encode_unit(const Unit& unit);

    [[nodiscard]] json encode_units(const std::vector<Unit>& units);

    [[nodiscard]] Result<Finding, Error> decode_finding(const json& value);

    [[nodiscard]] Result<Unit, Error> decode_unit(const json& value);

    /**
     * Decodes an array of units. The first invalid element fails the whole
     * batch; its index prefixes the error context.
     */
    [[nodiscard]] Result<std::vector<Unit>, Error> decode_units(const json& value);

    /**
     * Parses a severity wire name. Unknown names decode as Error.
     */
    [[nodiscard]] Severity severity_from_string(const std::string& name) noexcept;

}  // namespace ars::codec

#endif //ARS_UNIT_CODEC_HPP
