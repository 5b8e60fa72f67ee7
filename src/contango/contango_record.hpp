#pragma once

#include <array>
#include <cstdint>
#include <optional>

// ---------------------------------------------------------------------------
// ContangoRecord — one row of the VIXCentral-style contango dataset
// ---------------------------------------------------------------------------
struct ContangoRecord {
    static constexpr int MAX_PRICES = 12;
    static constexpr int RATIO_DECIMALS = 4;
    static constexpr int64_t RATIO_SCALE = 10'000;

    int date = 0;         // trading date, YYYYMMDD
    int front_month = 0;  // calendar month of F1's expiry

    // F1..F12 settlements in fixed_point::PRICE_SCALE units; F9..F12 are
    // empty when fewer contracts traded.
    std::array<std::optional<int64_t>, MAX_PRICES> prices{};

    // RATIO_SCALE units, already rounded half away from zero. Empty when the
    // denominator is zero.
    std::optional<int64_t> contango_f2_minus_f1;
    std::optional<int64_t> contango_f7_minus_f4;
    std::optional<int64_t> contango_f7_minus_f4_div_3;

    // 1-based, F1 == f(1)
    const std::optional<int64_t>& f(int n) const { return prices[n - 1]; }
};
