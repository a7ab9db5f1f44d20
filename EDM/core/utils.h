#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

struct ExportConfig {
    std::string apiBase;
    std::string apiToken;
    std::string accountId;

    std::string rootDir;
    std::string artifactSuffix;
    std::string exportType;

    std::int64_t cutoff;

    std::size_t maxConcurrent;
    std::size_t maxRetries;
    std::uint64_t backoffBaseMs;
    std::uint64_t backoffCapMs;

    std::uint64_t pollIntervalMs;
    std::uint64_t checkDelayMs;

    std::string filterCsv;
    std::string filterColumn;
    std::optional<std::int64_t> minStartDate;

    bool refreshListing;
    bool awaitInFlight;
};

struct RetryPolicy {
    std::size_t maxRetries;
    std::uint64_t backoffBaseMs;
    std::uint64_t backoffCapMs;
};

struct Entity {
    std::int64_t id;
    std::string name;
    std::string startAt;
};

enum class WorkflowState {
    Queued,
    Exported,
    Failed
};

struct Attachment {
    std::string url;
    std::string filename;
};

struct ExportJob {
    std::int64_t entityId;
    WorkflowState state;
    std::int64_t createdAt;
    std::optional<Attachment> attachment;
};

struct DownloadTask {
    std::int64_t entityId;
    std::string url;
    std::string destination;
    std::size_t attempt;
};

enum class EntityState {
    PendingCheck,
    ExportRequested,
    ExportReady,
    ArtifactPresent,
    TerminalFailure
};

enum class TransferErrorKind {
    None,
    Transport,
    UnexpectedStatus,
    Write,
    RetryBudgetExhausted
};

struct TransferReport {
    std::int64_t entityId;
    bool success;
    TransferErrorKind errorKind;
    std::string error;
    std::size_t attempts;
    std::uint64_t bytesWritten;
};

// ISO-8601 ("2025-06-08", "2025-06-08T10:00:00Z", "...+02:00", fractional
// seconds allowed) to seconds since the epoch.
std::optional<std::int64_t> parseTimestamp(const std::string& text);

// Year as written in the date part of an ISO-8601 timestamp; the UTC
// offset is not applied.
std::optional<int> yearOf(const std::string& text);

const char* toString(EntityState state);
const char* toString(TransferErrorKind kind);
