#pragma once

#include "contracts/contract.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "settlement/settlement_bar.hpp"
#include "time_utils.hpp"

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CBOE settlement CSV parsing.
// Column order: Trade Date,Futures,Open,High,Low,Close,Settle,Change,
//               Total Volume,EFP,Open Interest
// ---------------------------------------------------------------------------
namespace settlement_csv {

constexpr size_t MIN_FIELDS = 7;

inline std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> fields;
    std::string field;
    for (char c : line) {
        if (c == sep) {
            fields.push_back(field);
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(field);
    return fields;
}

inline std::vector<std::string> split_lines(const std::string& text) {
    std::string stripped;
    stripped.reserve(text.size());
    for (char c : text) {
        if (c != '\r') stripped.push_back(c);
    }
    return split(stripped, '\n');
}

inline bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Data rows start with a digit; the header and trailing blank lines do not.
inline bool is_data_line(const std::string& line) {
    return !is_blank(line) && std::isdigit(static_cast<unsigned char>(line.front()));
}

// Exact decimal price in fixed_point::PRICE_SCALE units.
inline int64_t parse_price(const std::string& field) {
    size_t begin = field.find_first_not_of(" \t");
    size_t end = field.find_last_not_of(" \t");
    std::string s = begin == std::string::npos ? "" : field.substr(begin, end - begin + 1);

    try {
        return fixed_point::parse(s);
    } catch (const std::invalid_argument& e) {
        throw SettlementFormatError("Invalid price: '" + field + "' (" + e.what() + ")");
    }
}

inline int parse_trade_date(const std::string& field) {
    try {
        return time_utils::parse_date(field);
    } catch (const std::invalid_argument& e) {
        throw SettlementFormatError(e.what());
    }
}

// Rows shorter than MIN_FIELDS are dropped. Rows dated on or after the
// contract's expiry are dropped: VIXCentral omits the final settlement day.
inline std::vector<SettlementBar> parse(const std::string& text, const ContractSymbol& contract) {
    std::vector<SettlementBar> bars;
    for (const auto& line : split_lines(text)) {
        if (!is_data_line(line)) continue;

        auto csv = split(line, ',');
        if (csv.size() < MIN_FIELDS) continue;

        size_t i = 0;
        int date = parse_trade_date(csv[i++]);
        if (date >= contract.expiry) continue;

        i++;  // "Futures" label
        SettlementBar bar;
        bar.date = date;
        bar.open = parse_price(csv[i++]);
        bar.high = parse_price(csv[i++]);
        bar.low = parse_price(csv[i++]);
        i++;  // Close can be zero; the settlement price stands in for it.
        bar.close = parse_price(csv[i++]);
        bar.contract = contract;
        bars.push_back(bar);
    }
    return bars;
}

}  // namespace settlement_csv
