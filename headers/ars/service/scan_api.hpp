//
// Created by gregorian-rayne on 10/08/26.
//

#ifndef ARS_SCAN_API_HPP
#define ARS_SCAN_API_HPP

/**
 * @file scan_api.hpp
 * @brief Request routing for the scan service, independent of sockets.
 *
 * Routes:
 * - POST /remediate        one Unit in, the scanned Unit out
 * - POST /remediate-array  Unit array in, scanned Units with findings out
 * - GET  /health           {"ok": true, "rules": [...], "version": "..."}
 *
 * The server feeds parsed requests in and writes the returned status and
 * body back; everything here can be exercised without a network.
 */

#include "ars/scanner/scanner.hpp"
#include "ars/utils/parallel.hpp"

#include <string>

namespace ars::service {

    struct ApiResponse {
        int status = 200;
        std::string content_type = "application/json";
        std::string body;
    };

    class ScanApi {
    public:
        /**
         * @param scanner Scanner to run. Must outlive the API.
         * @param pool Optional pool for batch requests; nullptr scans on the
         *             calling thread. Must outlive the API when given.
         */
        explicit ScanApi(const scanner::Scanner& scanner, parallel::ThreadPool* pool = nullptr) noexcept
            : scanner_(scanner), pool_(pool) {}

        /**
         * Dispatches one request.
         *
         * @param method HTTP method, upper case.
         * @param path Request target; any query string is ignored.
         * @param body Raw request body.
         */
        [[nodiscard]] ApiResponse handle(
            const std::string& method,
            const std::string& path,
            const std::string& body
        ) const;

        [[nodiscard]] ApiResponse handle_health() const;
        [[nodiscard]] ApiResponse handle_remediate(const std::string& body) const;
        [[nodiscard]] ApiResponse handle_remediate_array(const std::string& body) const;

    private:
        const scanner::Scanner& scanner_;
        parallel::ThreadPool* pool_;
    };

    /**
     * Returns the reason phrase for the status codes the service emits.
     */
    [[nodiscard]] const char* status_text(int status) noexcept;

}  // namespace ars::service

#endif //ARS_SCAN_API_HPP
