#pragma once

#include "contango/contango_record.hpp"
#include "contracts/contract.hpp"
#include "contracts/expiry_registry.hpp"
#include "fixed_point.hpp"
#include "settlement/settlement_bar.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Fewest contracts CBOE publishes on any trading day; thinner days are skipped.
constexpr int MIN_BARS_PER_DATE = 8;

// Expiry of the contract that precedes the chain's front month.
using PreviousExpiryResolver = std::function<int(const std::vector<ContractSymbol>&)>;

inline PreviousExpiryResolver make_previous_expiry_resolver(const ExpiryRegistry& registry) {
    return [registry](const std::vector<ContractSymbol>& chain) {
        const ContractSymbol& front = chain.front();
        const ExpiryFunc& expiry_func = registry.get(front.ticker, front.market);
        return expiry_func(time_utils::add_months(front.expiry, -1));
    };
}

// (numerator - denominator) / (denominator * divisor) in RATIO_SCALE units,
// rounded half away from zero. Empty when denominator is zero.
inline std::optional<int64_t> relative_spread(int64_t numerator, int64_t denominator,
                                              int64_t divisor = 1) {
    if (denominator == 0) return std::nullopt;
    return fixed_point::divide_round(
        fixed_point::checked_mul(numerator - denominator, ContangoRecord::RATIO_SCALE),
        fixed_point::checked_mul(denominator, divisor));
}

// ---------------------------------------------------------------------------
// ContangoCalculator — VIXCentral contango per trading date
// ---------------------------------------------------------------------------
class ContangoCalculator {
public:
    explicit ContangoCalculator(PreviousExpiryResolver previous_expiry)
        : previous_expiry_(std::move(previous_expiry)) {}

    // Dates before the previous expiry are dropped: their F1 would come from a
    // contract that was not yet the front month on that date.
    std::vector<ContangoRecord> compute(const BarsByDate& bars_by_date,
                                        const std::vector<ContractSymbol>& chain) const {
        std::vector<ContangoRecord> records;
        if (chain.empty()) return records;

        int cutoff = previous_expiry_(chain);

        for (const auto& [date, day_bars] : bars_by_date) {
            if (static_cast<int>(day_bars.size()) < MIN_BARS_PER_DATE || date < cutoff) {
                continue;
            }
            records.push_back(compute_day(date, day_bars));
        }
        return records;
    }

    static ContangoRecord compute_day(int date, std::vector<SettlementBar> bars) {
        if (static_cast<int>(bars.size()) < MIN_BARS_PER_DATE) {
            throw std::invalid_argument("compute_day requires at least " +
                                        std::to_string(MIN_BARS_PER_DATE) + " bars");
        }
        std::stable_sort(bars.begin(), bars.end(),
                         [](const SettlementBar& a, const SettlementBar& b) {
                             return a.contract.expiry < b.contract.expiry;
                         });

        ContangoRecord record;
        record.date = date;
        record.front_month = time_utils::month_of(bars.front().contract.expiry);

        size_t n = std::min(bars.size(), static_cast<size_t>(ContangoRecord::MAX_PRICES));
        for (size_t i = 0; i < n; ++i) {
            record.prices[i] = bars[i].close;
        }

        int64_t f1 = *record.f(1);
        int64_t f2 = *record.f(2);
        int64_t f4 = *record.f(4);
        int64_t f7 = *record.f(7);

        record.contango_f2_minus_f1 = relative_spread(f2, f1);
        record.contango_f7_minus_f4 = relative_spread(f7, f4);
        // Rounded once from the exact quotient, not from the rounded 7/4 ratio.
        record.contango_f7_minus_f4_div_3 = relative_spread(f7, f4, 3);
        return record;
    }

private:
    PreviousExpiryResolver previous_expiry_;
};
