// vix_contango_processor.cpp — daily VIX contango dataset builder
//
// Pipeline: ChainBuilder -> SettlementFetcher -> ContangoCalculator -> DatasetMerger.
// Writes <temp-output-directory>/alternative/<vendor>/vix_contango.csv (and the
// legacy vix_contago.csv), merged with any existing data found under
// <processed-data-directory>/alternative/<vendor>/.
//
// Usage: ./vix_contango_processor [--deployment-date yyyyMMdd] [--overwrite-existing-entries] ...

#include "config/processor_config.hpp"
#include "contango/contango_processor.hpp"
#include "log.hpp"
#include "settlement/curl_transport.hpp"
#include "settlement/rate_gate.hpp"
#include "time_utils.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    ProcessorConfig config;
    try {
        config = parse_processor_args(args, time_utils::today_utc());
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        std::cerr << usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    try {
        std::filesystem::create_directories(config.temp_output_directory);
        std::filesystem::create_directories(config.processed_data_directory);

        CurlTransport transport;
        RateGate gate(RATE_GATE_REQUESTS, RATE_GATE_PERIOD);
        ContangoProcessor processor(config, transport, gate);
        processor.process();
    } catch (const std::exception& e) {
        Log::error(e.what());
        return 1;
    }

    Log::info("=== VIX contango processing complete. ===");
    return 0;
}
