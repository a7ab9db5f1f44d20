#pragma once
#include <string>
#include <map>
#include <cstdint>

#include "RangeTransport.h"

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;

    // Header names are stored lower-cased.
    std::string header(const std::string& name) const;
    bool ok() const { return status >= 200 && status < 300; }
};

class HttpClient : public RangeTransport {
public:
    explicit HttpClient(const std::string& token);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    bool get(const std::string& url, HttpResponse& out);
    bool postJson(const std::string& url, const std::string& body, HttpResponse& out);

    StreamResult open(const std::string& url,
        std::uint64_t rangeStart,
        const StatusCallback& onStatus,
        const DataCallback& onData) override;

private:
    bool perform(const std::string& url, const std::string* jsonBody, HttpResponse& out);

private:
    void* curl;
    std::string bearer;
};
