#pragma once
#include <vector>
#include <map>
#include <set>
#include <string>
#include <future>
#include <functional>
#include <optional>
#include <csignal>
#include <cstdint>
#include <cstddef>

#include "utils.h"
#include "DownloadScheduler.h"
#include "../api/ExportApi.h"
#include "../io/ArtifactLayout.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

struct PollOptions {
    std::int64_t cutoff;
    std::uint64_t pollIntervalMs;
    std::uint64_t checkDelayMs;
    bool awaitInFlight;
};

// Drives each entity from pending-check to artifact-present. Status checks
// run one after another on the calling thread; only transfers run
// concurrently, on the scheduler.
//
// An entity leaves the pending set only when the pending-check finds its
// artifact on disk, so a transfer finished in round k is confirmed in
// round k + 1.
class ExportPoller {
public:
    using TransferRunner = std::function<TransferReport(const DownloadTask&)>;

    ExportPoller(ExportApi& api,
        const ArtifactLayout& layout,
        DownloadScheduler& scheduler,
        TransferRunner runner,
        const PollOptions& options,
        Logger& logger,
        ProgressTracker* progress = nullptr,
        volatile std::sig_atomic_t* externalStop = nullptr);

    // Returns true once every entity has its artifact, false when stopped or
    // when the remote API rejects the credentials.
    bool run(const std::vector<Entity>& entities);

    // Newest export that is exported, has an attachment and was created at
    // or after the cutoff.
    static std::optional<ExportJob> selectReady(const std::vector<ExportJob>& jobs, std::int64_t cutoff);

    std::size_t rounds() const { return roundCount; }
    bool credentialsRejected() const { return !rejection.empty(); }
    const std::string& rejectionReason() const { return rejection; }
    std::optional<EntityState> stateOf(std::int64_t entityId) const;

private:
    struct Dispatched {
        Entity entity;
        std::future<TransferReport> done;
    };

    std::vector<Entity> runRound(const std::vector<Entity>& pending);
    EntityState evaluate(const Entity& entity, std::vector<Dispatched>& dispatched, bool& calledRemote);
    EntityState requestExport(const Entity& entity, const std::vector<ExportJob>& jobs);
    EntityState dispatch(const Entity& entity, const ExportJob& job, std::vector<Dispatched>& dispatched);
    void awaitTransfers(std::vector<Dispatched>& dispatched);

    bool checkCredentials(const Entity& entity, const char* call, const ApiResult& result);
    bool stopRequested() const;
    void pause(std::uint64_t ms) const;

private:
    ExportApi& api;
    const ArtifactLayout& layout;
    DownloadScheduler& scheduler;
    TransferRunner runTransfer;
    PollOptions opts;
    Logger& logger;
    ProgressTracker* progress;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    std::map<std::int64_t, EntityState> states;
    std::map<std::int64_t, std::size_t> dispatchCount;
    std::size_t roundCount{ 0 };
    std::string rejection;
};
