#pragma once

#include "time_utils.hpp"

#include <string>
#include <tuple>

// ---------------------------------------------------------------------------
// ContractSymbol — one futures contract, identified by root and expiry
// ---------------------------------------------------------------------------
struct ContractSymbol {
    std::string ticker;
    std::string market;
    int expiry = 0;  // YYYYMMDD

    std::string to_string() const {
        return ticker + " " + time_utils::format_date(expiry);
    }
};

inline bool operator<(const ContractSymbol& a, const ContractSymbol& b) {
    return std::tie(a.expiry, a.ticker, a.market) < std::tie(b.expiry, b.ticker, b.market);
}

inline bool operator==(const ContractSymbol& a, const ContractSymbol& b) {
    return a.expiry == b.expiry && a.ticker == b.ticker && a.market == b.market;
}
