//
// Created by gregorian-rayne on 10/09/26.
//

#ifndef ARS_APP_HPP
#define ARS_APP_HPP

#include "cli_parser.hpp"
#include "ars/config/config.hpp"
#include "ars/result.hpp"
#include "ars/rules/rule.hpp"
#include "ars/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace ars::cli {

    /**
     * Units read from an input file. A single object input is kept apart
     * from an array so the output has the same shape.
     */
    struct LoadedUnits {
        std::vector<Unit> units;
        bool single = false;
    };

    class App {
    public:
        explicit App(Options options);

        int run();

    private:
        int run_scan() const;
        int run_serve() const;
        int run_rules() const;

        Result<void> load_config();
        Result<rules::RuleSet> build_rule_set() const;

        static Result<LoadedUnits> load_units(const std::string& file_path);
        static void print_text_report(std::ostream& out, const std::vector<Unit>& units);

        Options options_;
        config::Config config_;
    };

} // namespace ars::cli

#endif //ARS_APP_HPP
