#pragma once

#include "errors.hpp"
#include "time_utils.hpp"

#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ProcessorConfig — everything one contango run needs
// ---------------------------------------------------------------------------
struct ProcessorConfig {
    std::string temp_output_directory = "/temp-output-directory";
    std::string processed_data_directory = "/Data";
    std::string output_vendor_directory = "vixcentral";
    std::string base_url =
        "https://www.cboe.com/us/futures/market_statistics/historical_data/products/csv";
    std::string ticker = "VX";
    bool overwrite_existing_entries = false;
    bool only_deployment_date = false;
    int deployment_date = 0;  // YYYYMMDD
    int start_date = 0;       // YYYYMMDD
    int today = 0;            // YYYYMMDD, UTC
    bool show_help = false;
};

constexpr const char* DEPLOYMENT_DATE_ENV = "QC_DATAFLEET_DEPLOYMENT_DATE";

inline std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --temp-output-directory <dir>      output root (default /temp-output-directory)\n"
           "  --processed-data-directory <dir>   existing data root (default /Data)\n"
           "  --output-vendor-directory <name>   dataset directory (default vixcentral)\n"
           "  --deployment-date <yyyyMMdd>       default $" + std::string(DEPLOYMENT_DATE_ENV) +
           " or today (UTC)\n"
           "  --start-date <yyyyMMdd>            default deployment date - 1 day\n"
           "  --base-url <url>                   CBOE settlement CSV endpoint\n"
           "  --overwrite-existing-entries       replace rows already in the dataset\n"
           "  --only-deployment-date             only write the deployment date's row\n"
           "  --help\n";
}

namespace config_detail {

inline int parse_date_arg(const std::string& flag, const std::string& value) {
    try {
        return time_utils::parse_compact(value);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(flag + ": " + e.what());
    }
}

}  // namespace config_detail

// Environment lookup is injectable for tests; nullptr means "unset".
using EnvLookup = std::function<const char*(const char*)>;

inline ProcessorConfig parse_processor_args(const std::vector<std::string>& args,
                                            int today,
                                            const EnvLookup& getenv_fn = [](const char* name) {
                                                return std::getenv(name);
                                            }) {
    ProcessorConfig cfg;
    cfg.today = today;

    std::string deployment_arg;
    std::string start_arg;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--temp-output-directory") {
            cfg.temp_output_directory = value();
        } else if (arg == "--processed-data-directory") {
            cfg.processed_data_directory = value();
        } else if (arg == "--output-vendor-directory") {
            cfg.output_vendor_directory = value();
        } else if (arg == "--deployment-date") {
            deployment_arg = value();
        } else if (arg == "--start-date") {
            start_arg = value();
        } else if (arg == "--base-url") {
            cfg.base_url = value();
        } else if (arg == "--overwrite-existing-entries") {
            cfg.overwrite_existing_entries = true;
        } else if (arg == "--only-deployment-date") {
            cfg.only_deployment_date = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }

    if (!deployment_arg.empty()) {
        cfg.deployment_date = config_detail::parse_date_arg("--deployment-date", deployment_arg);
    } else if (const char* env = getenv_fn(DEPLOYMENT_DATE_ENV); env && *env) {
        cfg.deployment_date = config_detail::parse_date_arg(DEPLOYMENT_DATE_ENV, env);
    } else {
        cfg.deployment_date = today;
    }

    cfg.start_date = start_arg.empty()
                         ? time_utils::add_days(cfg.deployment_date, -1)
                         : config_detail::parse_date_arg("--start-date", start_arg);

    if (cfg.output_vendor_directory.empty()) {
        throw ConfigError("--output-vendor-directory must not be empty");
    }
    return cfg;
}
