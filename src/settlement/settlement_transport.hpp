#pragma once

#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    bool not_found() const { return status == 404; }
};

// ---------------------------------------------------------------------------
// SettlementTransport — fetch strategy used by SettlementFetcher.
// Returns the HTTP status and body; throws TransportError when no response
// was received at all.
// ---------------------------------------------------------------------------
class SettlementTransport {
public:
    virtual ~SettlementTransport() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};
