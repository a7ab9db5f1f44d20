#pragma once
#include <string>
#include <functional>
#include <cstdint>
#include <cstddef>

struct StreamResult {
    bool transportOk = false;
    long status = 0;
    std::string error;
};

// Streams one HTTP GET, optionally starting at a byte offset.
// onStatus sees the final response status before any body byte; returning
// false drains the body without forwarding it. onData returning false aborts
// the transfer.
class RangeTransport {
public:
    using StatusCallback = std::function<bool(long)>;
    using DataCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~RangeTransport() = default;

    virtual StreamResult open(const std::string& url,
        std::uint64_t rangeStart,
        const StatusCallback& onStatus,
        const DataCallback& onData) = 0;
};
