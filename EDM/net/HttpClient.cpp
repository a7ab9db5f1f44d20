#include "HttpClient.h"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace {
constexpr long kConnectTimeoutSec = 30;
// Abort when the link stays below 1 byte/s for two minutes
constexpr long kLowSpeedLimit = 1;
constexpr long kLowSpeedTimeSec = 120;
constexpr long kMaxRedirects = 5;

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        if (list)
            curl_slist_free_all(list);
    }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t bodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nmemb;
    body->append(ptr, total);
    return total;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    std::string line(buffer, total);

    // A new status line starts a new header block (redirects)
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos)
        (*headers)[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));

    return total;
}

struct StreamContext {
    CURL* handle;
    const RangeTransport::StatusCallback* onStatus;
    const RangeTransport::DataCallback* onData;
    bool statusSeen = false;
    bool forward = false;
};

size_t streamCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    std::size_t total = size * nmemb;

    if (!ctx->statusSeen) {
        long status = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
        ctx->statusSeen = true;
        ctx->forward = (*ctx->onStatus)(status);
    }

    if (!ctx->forward)
        return total;

    if (!(*ctx->onData)(ptr, total))
        return 0;
    return total;
}

HeaderList makeHeaders(const std::string& bearer, bool json) {
    curl_slist* list = curl_slist_append(nullptr, ("Authorization: Bearer " + bearer).c_str());
    if (json && list) {
        curl_slist* extended = curl_slist_append(list, "Content-Type: application/json");
        if (extended)
            list = extended;
    }
    return HeaderList(list);
}

void applyCommonOptions(CURL* c, const std::string& url, curl_slist* headers) {
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec);
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimit);
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeSec);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
}
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient(const std::string& token)
    : bearer(token) {
    curl = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

bool HttpClient::get(const std::string& url, HttpResponse& out) {
    return perform(url, nullptr, out);
}

bool HttpClient::postJson(const std::string& url, const std::string& body, HttpResponse& out) {
    return perform(url, &body, out);
}

bool HttpClient::perform(const std::string& url, const std::string* jsonBody, HttpResponse& out) {
    out = HttpResponse{};

    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        out.error = "curl handle unavailable";
        return false;
    }

    curl_easy_reset(c);

    HeaderList headers = makeHeaders(bearer, jsonBody != nullptr);
    applyCommonOptions(c, url, headers.get());

    if (jsonBody) {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, jsonBody->c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(jsonBody->size()));
    }

    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, bodyCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &out.headers);

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        out.error = curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);
    return true;
}

StreamResult HttpClient::open(const std::string& url,
    std::uint64_t rangeStart,
    const StatusCallback& onStatus,
    const DataCallback& onData) {
    StreamResult result;

    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        result.error = "curl handle unavailable";
        return result;
    }

    curl_easy_reset(c);

    HeaderList headers = makeHeaders(bearer, false);
    applyCommonOptions(c, url, headers.get());

    // No Range header at all for a fresh download
    std::string range;
    if (rangeStart > 0) {
        range = std::to_string(rangeStart) + "-";
        curl_easy_setopt(c, CURLOPT_RANGE, range.c_str());
    }

    StreamContext ctx{ c, &onStatus, &onData };
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, streamCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &result.status);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        return result;
    }

    if (!ctx.statusSeen)
        onStatus(result.status);

    result.transportOk = true;
    return result;
}
