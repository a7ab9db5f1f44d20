#include "ResumableTransfer.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

#include "../io/FileWriter.h"
#include "../io/SourceRecord.h"

namespace fs = std::filesystem;

namespace {
constexpr long kStatusOk = 200;
constexpr long kStatusPartial = 206;
constexpr long kStatusRangeNotSatisfiable = 416;
}

ResumableTransfer::ResumableTransfer(RangeTransport& t,
    const RetryPolicy& policy,
    Logger& log,
    ProgressTracker* tracker)
    : transport(t),
    retry(policy),
    logger(log),
    progress(tracker) {
}

std::uint64_t ResumableTransfer::backoffMs(const RetryPolicy& policy, std::size_t retryIndex) {
    std::uint64_t delay = policy.backoffBaseMs;
    for (std::size_t i = 0; i < retryIndex && delay < policy.backoffCapMs; ++i)
        delay *= 2;
    return std::min(delay, policy.backoffCapMs);
}

std::string ResumableTransfer::partialPath(const std::string& destination) {
    return destination + ".part";
}

std::string ResumableTransfer::sourcePath(const std::string& destination) {
    return partialPath(destination) + ".src";
}

TransferReport ResumableTransfer::run(const DownloadTask& task) {
    TransferReport rep{};
    rep.entityId = task.entityId;
    rep.success = false;
    rep.errorKind = TransferErrorKind::None;
    rep.attempts = 0;
    rep.bytesWritten = 0;

    for (std::size_t i = 0; i <= retry.maxRetries; ++i) {
        ++rep.attempts;

        if (attempt(task, rep) && finish(task, rep)) {
            rep.success = true;
            rep.errorKind = TransferErrorKind::None;
            rep.error.clear();
            return rep;
        }

        if (i == retry.maxRetries)
            break;

        const auto delay = backoffMs(retry, i);
        logger.warn("Entity " + std::to_string(task.entityId) + ": " + rep.error +
            ", retrying in " + std::to_string(delay) + "ms");
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }

    rep.errorKind = TransferErrorKind::RetryBudgetExhausted;
    rep.error = "gave up after " + std::to_string(rep.attempts) + " attempts: " + rep.error;
    return rep;
}

bool ResumableTransfer::adoptPartial(const DownloadTask& task, TransferReport& rep) {
    const std::string part = partialPath(task.destination);
    SourceRecord source(sourcePath(task.destination));

    std::string recorded;
    if (source.load(recorded) && recorded == task.url)
        return true;

    if (FileWriter::sizeOnDisk(part) > 0) {
        logger.info("Entity " + std::to_string(task.entityId) +
            ": partial file was not downloaded from " + task.url + ", starting over");
        std::error_code ec;
        fs::remove(part, ec);
        if (ec) {
            rep.errorKind = TransferErrorKind::Write;
            rep.error = "cannot discard " + part + ": " + ec.message();
            return false;
        }
    }

    if (!source.save(task.url)) {
        rep.errorKind = TransferErrorKind::Write;
        rep.error = "cannot write " + source.path();
        return false;
    }
    return true;
}

bool ResumableTransfer::attempt(const DownloadTask& task, TransferReport& rep) {
    if (!adoptPartial(task, rep))
        return false;

    const std::string part = partialPath(task.destination);
    const std::uint64_t offset = FileWriter::sizeOnDisk(part);

    FileWriter writer(part);
    bool writeFailed = false;

    auto onStatus = [&](long status) {
        if (status == kStatusPartial) {
            writeFailed = !writer.open(false);
            return !writeFailed;
        }
        if (status == kStatusOk) {
            // Range ignored or fresh start: the body is the whole file
            if (offset > 0)
                logger.info("Entity " + std::to_string(task.entityId) +
                    ": server ignored range, restarting from byte 0");
            writeFailed = !writer.open(true);
            return !writeFailed;
        }
        return false;
    };

    auto onData = [&](const char* data, std::size_t size) {
        if (!writer.append(data, size)) {
            writeFailed = true;
            return false;
        }
        if (progress)
            progress->add(size);
        return true;
    };

    StreamResult res = transport.open(task.url, offset, onStatus, onData);
    if (writer.isOpen() && !writer.flush())
        writeFailed = true;
    writer.close();
    rep.bytesWritten += writer.written();

    if (writeFailed) {
        rep.errorKind = TransferErrorKind::Write;
        rep.error = "cannot write " + part;
        return false;
    }

    if (!res.transportOk) {
        rep.errorKind = TransferErrorKind::Transport;
        rep.error = res.error.empty() ? "transport error" : res.error;
        return false;
    }

    if (res.status == kStatusOk || res.status == kStatusPartial)
        return true;

    if (res.status == kStatusRangeNotSatisfiable && offset > 0) {
        logger.info("Entity " + std::to_string(task.entityId) + ": already complete at " +
            std::to_string(offset) + " bytes");
        return true;
    }

    rep.errorKind = TransferErrorKind::UnexpectedStatus;
    rep.error = "unexpected status " + std::to_string(res.status);
    return false;
}

bool ResumableTransfer::finish(const DownloadTask& task, TransferReport& rep) {
    std::error_code ec;
    fs::rename(partialPath(task.destination), task.destination, ec);
    if (ec) {
        rep.errorKind = TransferErrorKind::Write;
        rep.error = "cannot move " + partialPath(task.destination) + " into place: " + ec.message();
        return false;
    }

    SourceRecord source(sourcePath(task.destination));
    if (!source.remove())
        logger.warn("Entity " + std::to_string(task.entityId) + ": cannot remove " + source.path());
    return true;
}
