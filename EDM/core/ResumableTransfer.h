#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

#include "utils.h"
#include "../net/RangeTransport.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

// Runs one download to completion. The resume offset is re-read from the
// partial file before every attempt; nothing is cached between attempts.
class ResumableTransfer {
public:
    ResumableTransfer(RangeTransport& transport,
        const RetryPolicy& policy,
        Logger& logger,
        ProgressTracker* progress = nullptr);

    TransferReport run(const DownloadTask& task);

    // Wait before retry number retryIndex (0-based).
    static std::uint64_t backoffMs(const RetryPolicy& policy, std::size_t retryIndex);

    // File that receives bytes until the transfer completes.
    static std::string partialPath(const std::string& destination);
    // Holds the URL the partial file came from.
    static std::string sourcePath(const std::string& destination);

private:
    bool adoptPartial(const DownloadTask& task, TransferReport& rep);
    bool attempt(const DownloadTask& task, TransferReport& rep);
    bool finish(const DownloadTask& task, TransferReport& rep);

private:
    RangeTransport& transport;
    RetryPolicy retry;
    Logger& logger;
    ProgressTracker* progress;
};
