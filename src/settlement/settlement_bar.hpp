#pragma once

#include "contracts/contract.hpp"

#include <cstdint>
#include <map>
#include <vector>

// ---------------------------------------------------------------------------
// SettlementBar — one contract's daily record (close = settlement price).
// Prices are fixed-point, fixed_point::PRICE_SCALE units per point.
// ---------------------------------------------------------------------------
struct SettlementBar {
    int date = 0;  // trading date, YYYYMMDD
    int64_t open = 0;
    int64_t high = 0;
    int64_t low = 0;
    int64_t close = 0;
    int period_days = 1;
    ContractSymbol contract;
};

// Trading date -> bars seen that day, in download (chain) order.
using BarsByDate = std::map<int, std::vector<SettlementBar>>;
