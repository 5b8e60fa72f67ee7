#pragma once

#include "contracts/contract.hpp"
#include "contracts/expiry_registry.hpp"
#include "log.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// CBOE never lists more than twelve VX months past the current date.
constexpr int DEFAULT_LOOKAHEAD_CONTRACTS = 12;

// ---------------------------------------------------------------------------
// ChainBuilder — futures contracts to download, ordered by expiry
// ---------------------------------------------------------------------------
class ChainBuilder {
public:
    ChainBuilder(std::string ticker, MarketResolver markets, ExpiryRegistry expiries)
        : ticker_(std::move(ticker)),
          markets_(std::move(markets)),
          expiries_(std::move(expiries)) {}

    // Every contract expiring on/after start_date, up to and including the
    // lookahead-th expiry on/after today. When start_date is in the past the
    // chain therefore holds more than `lookahead` contracts.
    std::vector<ContractSymbol> build(int start_date, int today,
                                      int lookahead = DEFAULT_LOOKAHEAD_CONTRACTS) const {
        if (lookahead <= 0) {
            throw std::invalid_argument("lookahead must be positive");
        }

        std::string market = markets_(ticker_);
        const ExpiryFunc& expiry_func = expiries_.get(ticker_, market);

        int max_scan_days = std::max(0, time_utils::days_between(start_date, today)) +
                            31 * (lookahead + 2);

        std::set<int> expiries;
        int expiries_after_today = 0;
        int current = start_date;

        for (int scanned = 0; expiries_after_today != lookahead; ++scanned) {
            if (scanned > max_scan_days) {
                throw std::runtime_error("Expiry function for " + ticker_ +
                                         " did not yield enough contracts after " +
                                         std::to_string(max_scan_days) + " days");
            }

            int expiry = expiry_func(current);
            current = time_utils::add_days(current, 1);

            // Already expired relative to start_date.
            if (expiry < start_date) continue;

            if (expiries.insert(expiry).second) {
                Log::info("ChainBuilder: including expiry " + time_utils::format_date(expiry) +
                          " for " + ticker_ + " contango calculation");
                if (expiry >= today) ++expiries_after_today;
            }
        }

        std::vector<ContractSymbol> chain;
        chain.reserve(expiries.size());
        for (int expiry : expiries) {
            chain.push_back(ContractSymbol{ticker_, market, expiry});
        }
        return chain;
    }

private:
    std::string ticker_;
    MarketResolver markets_;
    ExpiryRegistry expiries_;
};
