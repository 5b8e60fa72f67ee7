#pragma once

#include <stdexcept>
#include <string>

// Missing market / expiry function, or an unusable command-line value.
struct ConfigError : std::runtime_error {
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Any transport failure other than HTTP 404. Retried by the fetcher.
struct TransportError : std::runtime_error {
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

struct MaxRetriesExceeded : std::runtime_error {
    explicit MaxRetriesExceeded(const std::string& what) : std::runtime_error(what) {}
};

// Settlement CSV row with an unparsable date or price.
struct SettlementFormatError : std::invalid_argument {
    explicit SettlementFormatError(const std::string& what) : std::invalid_argument(what) {}
};

// Existing dataset file that cannot be keyed by date.
struct DatasetFormatError : std::runtime_error {
    explicit DatasetFormatError(const std::string& what) : std::runtime_error(what) {}
};
