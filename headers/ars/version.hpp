//
// Created by gregorian-rayne on 10/02/26.
//

#ifndef ARS_VERSION_HPP
#define ARS_VERSION_HPP

/**
 * @file version.hpp
 * @brief ABAP Rule Scanner version information.
 */

namespace ars {

    constexpr int VERSION_MAJOR = 2;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "2.0.0";

    /**
     * Version reported by the service health probe.
     * Clients compare against it, so it only carries major.minor.
     */
    constexpr auto API_VERSION = "2.0";

    constexpr auto PROJECT_NAME = "ABAP Rule Scanner";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "ars";

}  // namespace ars

#endif //ARS_VERSION_HPP
