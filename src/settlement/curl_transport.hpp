#pragma once

#include "errors.hpp"
#include "settlement/settlement_transport.hpp"

#include <curl/curl.h>

#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// CurlTransport — libcurl GET with a browser user agent
// ---------------------------------------------------------------------------
class CurlTransport : public SettlementTransport {
public:
    static constexpr const char* DEFAULT_USER_AGENT =
        "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:91.0) Gecko/20100101 Firefox/91.0";

    explicit CurlTransport(std::string user_agent = DEFAULT_USER_AGENT, long timeout_s = 30)
        : user_agent_(std::move(user_agent)), timeout_s_(timeout_s) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlTransport() override { curl_global_cleanup(); }

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const std::string& url) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw TransportError("Failed to initialize CURL");
        }

        std::string body;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::string error = curl_easy_strerror(res);
            curl_easy_cleanup(curl);
            throw TransportError("GET " + url + " failed: " + error);
        }

        HttpResponse response;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        response.body = std::move(body);
        curl_easy_cleanup(curl);
        return response;
    }

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* buffer = static_cast<std::string*>(userdata);
        buffer->append(ptr, size * nmemb);
        return size * nmemb;
    }

    std::string user_agent_;
    long timeout_s_;
};
