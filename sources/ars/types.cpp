//
// Created by gregorian-rayne on 10/02/26.
//

#include "ars/types.hpp"

namespace ars
{
    const char* to_string(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Info:    return "info";
            case Severity::Warning: return "warning";
            case Severity::Error:   return "error";
        }
        return "error";
    }
}  // namespace ars
