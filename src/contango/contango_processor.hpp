#pragma once

#include "config/processor_config.hpp"
#include "contango/contango_calculator.hpp"
#include "contango/contango_dataset.hpp"
#include "contracts/chain_builder.hpp"
#include "contracts/expiry_registry.hpp"
#include "log.hpp"
#include "settlement/rate_gate.hpp"
#include "settlement/settlement_fetcher.hpp"
#include "settlement/settlement_transport.hpp"
#include "time_utils.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

// CBOE asks for no more than one request every five seconds.
constexpr int RATE_GATE_REQUESTS = 1;
constexpr std::chrono::seconds RATE_GATE_PERIOD{5};

// ---------------------------------------------------------------------------
// ContangoProcessor — chain -> settlements -> contango -> dataset
// ---------------------------------------------------------------------------
class ContangoProcessor {
public:
    ContangoProcessor(const ProcessorConfig& config,
                      SettlementTransport& transport,
                      RateGate& gate,
                      MarketResolver markets = MarketRegistry::with_defaults().resolver(),
                      ExpiryRegistry expiries = ExpiryRegistry::with_defaults(),
                      PreviousExpiryResolver previous_expiry = nullptr)
        : config_(config),
          chain_builder_(config.ticker, markets, expiries),
          fetcher_(transport, gate, FetchConfig{config.base_url}),
          calculator_(previous_expiry ? std::move(previous_expiry)
                                      : make_previous_expiry_resolver(expiries)),
          merger_(MergeConfig{config.temp_output_directory,
                              config.processed_data_directory,
                              config.output_vendor_directory,
                              config.overwrite_existing_entries,
                              config.only_deployment_date,
                              config.deployment_date}) {}

    std::vector<ContangoRecord> process() {
        Log::info("ContangoProcessor: deployment date " +
                  time_utils::format_date(config_.deployment_date) + ", start date " +
                  time_utils::format_date(config_.start_date));

        auto chain = chain_builder_.build(config_.start_date, config_.today);
        auto bars = fetcher_.fetch(chain);
        auto records = calculator_.compute(bars, chain);

        Log::info("ContangoProcessor: " + std::to_string(bars.size()) + " trading dates, " +
                  std::to_string(records.size()) + " contango rows");

        merger_.merge(records);
        return records;
    }

private:
    ProcessorConfig config_;
    ChainBuilder chain_builder_;
    SettlementFetcher fetcher_;
    ContangoCalculator calculator_;
    DatasetMerger merger_;
};
