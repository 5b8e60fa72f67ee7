#pragma once

#include "contracts/contract.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settlement/rate_gate.hpp"
#include "settlement/settlement_bar.hpp"
#include "settlement/settlement_parser.hpp"
#include "settlement/settlement_transport.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// FetchConfig
// ---------------------------------------------------------------------------
struct FetchConfig {
    std::string base_url =
        "https://www.cboe.com/us/futures/market_statistics/historical_data/products/csv";
    int max_attempts = 5;
};

// ---------------------------------------------------------------------------
// SettlementFetcher — downloads settlement history for each contract in chain
// order. HTTP 404 means CBOE has nothing this far out yet: the remaining
// contracts are skipped and the bars gathered so far are returned.
// ---------------------------------------------------------------------------
class SettlementFetcher {
public:
    SettlementFetcher(SettlementTransport& transport, RateGate& gate, FetchConfig config = {})
        : transport_(transport), gate_(gate), config_(std::move(config)) {}

    std::string url_for(const ContractSymbol& contract) const {
        std::string base = config_.base_url;
        while (!base.empty() && base.back() == '/') base.pop_back();

        std::string ticker = contract.ticker;
        std::transform(ticker.begin(), ticker.end(), ticker.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return base + "/" + ticker + "/" + time_utils::format_date(contract.expiry) + "/";
    }

    BarsByDate fetch(const std::vector<ContractSymbol>& chain) {
        BarsByDate bars_by_date;

        for (const auto& contract : chain) {
            auto body = download(contract);
            if (!body) {
                Log::info("SettlementFetcher: no data for " + contract.to_string() +
                          " (too far into the future); all available data downloaded");
                return bars_by_date;
            }
            if (body->empty()) {
                throw TransportError("Empty settlement response for " + contract.to_string());
            }

            for (auto& bar : settlement_csv::parse(*body, contract)) {
                bars_by_date[bar.date].push_back(std::move(bar));
            }
        }

        return bars_by_date;
    }

private:
    // nullopt on 404; throws MaxRetriesExceeded once every attempt has failed.
    std::optional<std::string> download(const ContractSymbol& contract) {
        const std::string url = url_for(contract);

        for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
            gate_.wait_to_proceed();

            std::string failure;
            try {
                HttpResponse response = transport_.get(url);
                if (response.not_found()) return std::nullopt;
                if (response.ok()) {
                    Log::info("SettlementFetcher: downloaded " + contract.to_string() +
                              " (attempt " + std::to_string(attempt) + "/" +
                              std::to_string(config_.max_attempts) + ")");
                    return std::move(response.body);
                }
                failure = "HTTP " + std::to_string(response.status);
            } catch (const TransportError& e) {
                failure = e.what();
            }

            Log::error("SettlementFetcher: " + url + " attempt " + std::to_string(attempt) + "/" +
                       std::to_string(config_.max_attempts) + " failed: " + failure);
        }

        throw MaxRetriesExceeded("Max retries exceeded (" + std::to_string(config_.max_attempts) +
                                 "/" + std::to_string(config_.max_attempts) + ") for " +
                                 contract.to_string());
    }

    SettlementTransport& transport_;
    RateGate& gate_;
    FetchConfig config_;
};
