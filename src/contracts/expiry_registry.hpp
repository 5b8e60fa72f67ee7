#pragma once

#include "contracts/holiday_calendar.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

#include <functional>
#include <map>
#include <string>
#include <utility>

// Maps a date to the expiry of the contract listed for that date's month.
using ExpiryFunc = std::function<int(int)>;

// Resolves a root ticker to its listing market; throws ConfigError if unknown.
using MarketResolver = std::function<std::string(const std::string&)>;

namespace expiry_rules {

constexpr int FRIDAY = 5;

// VX final settlement: the Wednesday 30 days before the third Friday of the
// following month. A holiday Friday shifts the anchor to the prior business
// day; a holiday settlement day moves to the prior business day.
inline int vx_expiry(int date, const HolidayCalendar& calendar) {
    using namespace time_utils;
    int following = add_months(make_date(year_of(date), month_of(date), 1), 1);
    int third_friday = nth_weekday(year_of(following), month_of(following), FRIDAY, 3);

    int anchor = calendar.is_business_day(third_friday)
                     ? third_friday
                     : calendar.previous_business_day(third_friday);

    int expiry = add_days(anchor, -30);
    if (!calendar.is_business_day(expiry)) {
        expiry = calendar.previous_business_day(expiry);
    }
    return expiry;
}

}  // namespace expiry_rules

// ---------------------------------------------------------------------------
// ExpiryRegistry — (ticker, market) -> expiry function
// ---------------------------------------------------------------------------
class ExpiryRegistry {
public:
    ExpiryRegistry() = default;

    static ExpiryRegistry with_defaults() {
        ExpiryRegistry registry;
        HolidayCalendar calendar;
        registry.add("VX", "cfe", [calendar](int date) {
            return expiry_rules::vx_expiry(date, calendar);
        });
        return registry;
    }

    void add(const std::string& ticker, const std::string& market, ExpiryFunc func) {
        funcs_[{ticker, market}] = std::move(func);
    }

    bool contains(const std::string& ticker, const std::string& market) const {
        return funcs_.count({ticker, market}) > 0;
    }

    const ExpiryFunc& get(const std::string& ticker, const std::string& market) const {
        auto it = funcs_.find({ticker, market});
        if (it == funcs_.end()) {
            throw ConfigError(ticker + " expiry function not found with market: " + market);
        }
        return it->second;
    }

private:
    std::map<std::pair<std::string, std::string>, ExpiryFunc> funcs_;
};

// ---------------------------------------------------------------------------
// MarketRegistry — ticker -> market
// ---------------------------------------------------------------------------
class MarketRegistry {
public:
    MarketRegistry() = default;

    static MarketRegistry with_defaults() {
        MarketRegistry registry;
        registry.add("VX", "cfe");
        return registry;
    }

    void add(const std::string& ticker, const std::string& market) {
        markets_[ticker] = market;
    }

    std::string market_for(const std::string& ticker) const {
        auto it = markets_.find(ticker);
        if (it == markets_.end()) {
            throw ConfigError("No market found for future: " + ticker);
        }
        return it->second;
    }

    MarketResolver resolver() const {
        MarketRegistry copy = *this;
        return [copy](const std::string& ticker) { return copy.market_for(ticker); };
    }

private:
    std::map<std::string, std::string> markets_;
};
