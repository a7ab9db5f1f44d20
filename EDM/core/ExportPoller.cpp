#include "ExportPoller.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace {
constexpr std::uint64_t kPauseSliceMs = 100;

std::string describe(const Entity& e) {
    return "\"" + e.name + "\" (" + std::to_string(e.id) + ")";
}
}

ExportPoller::ExportPoller(ExportApi& remote,
    const ArtifactLayout& artifacts,
    DownloadScheduler& sched,
    TransferRunner runner,
    const PollOptions& options,
    Logger& log,
    ProgressTracker* tracker,
    volatile std::sig_atomic_t* externalStop)
    : api(remote),
    layout(artifacts),
    scheduler(sched),
    runTransfer(std::move(runner)),
    opts(options),
    logger(log),
    progress(tracker),
    externalStopSignal(externalStop) {
}

std::optional<ExportJob> ExportPoller::selectReady(const std::vector<ExportJob>& jobs, std::int64_t cutoff) {
    std::optional<ExportJob> best;

    for (const auto& job : jobs) {
        if (job.state != WorkflowState::Exported || !job.attachment || job.createdAt < cutoff)
            continue;
        if (!best || job.createdAt > best->createdAt)
            best = job;
    }
    return best;
}

std::optional<EntityState> ExportPoller::stateOf(std::int64_t entityId) const {
    auto it = states.find(entityId);
    if (it == states.end())
        return std::nullopt;
    return it->second;
}

bool ExportPoller::run(const std::vector<Entity>& entities) {
    // One pending slot per id, so no two transfers share a destination
    std::vector<Entity> pending;
    std::set<std::int64_t> seen;
    for (const auto& e : entities) {
        if (!seen.insert(e.id).second) {
            logger.warn("Entity " + describe(e) + " is listed more than once, ignoring the repeat");
            continue;
        }
        pending.push_back(e);
        states[e.id] = EntityState::PendingCheck;
    }

    while (!pending.empty()) {
        if (stopRequested()) {
            logger.warn("Stop requested, " + std::to_string(pending.size()) + " entities left pending");
            return false;
        }

        pending = runRound(pending);

        if (credentialsRejected()) {
            logger.error("Aborting: " + rejection);
            return false;
        }

        if (pending.empty())
            break;

        logger.info("Waiting for " + std::to_string(pending.size()) +
            " export(s) to finish before checking again...");
        pause(opts.pollIntervalMs);
    }

    logger.info("All entities have their artifacts.");
    return true;
}

std::vector<Entity> ExportPoller::runRound(const std::vector<Entity>& pending) {
    ++roundCount;
    logger.info("Round " + std::to_string(roundCount) + ": checking " +
        std::to_string(pending.size()) + " entities");

    std::vector<Entity> stillPending;
    std::vector<Dispatched> dispatched;
    std::size_t requested = 0;

    for (std::size_t i = 0; i < pending.size(); ++i) {
        const Entity& entity = pending[i];

        // Unchecked entities simply carry over to the next round
        if (stopRequested() || credentialsRejected()) {
            stillPending.insert(stillPending.end(), pending.begin() + i, pending.end());
            break;
        }

        bool calledRemote = false;
        const EntityState state = evaluate(entity, dispatched, calledRemote);
        states[entity.id] = state;

        if (state == EntityState::ExportRequested)
            ++requested;
        if (state != EntityState::ArtifactPresent)
            stillPending.push_back(entity);

        if (calledRemote)
            pause(opts.checkDelayMs);
    }

    const std::size_t transfers = dispatched.size();
    awaitTransfers(dispatched);

    std::size_t failed = 0;
    for (const auto& e : stillPending) {
        if (states[e.id] == EntityState::TerminalFailure)
            ++failed;
    }

    logger.info("Round " + std::to_string(roundCount) + " done: " +
        std::to_string(transfers) + " transfer(s) dispatched, " +
        std::to_string(failed) + " failed, " +
        std::to_string(requested) + " export(s) requested, " +
        std::to_string(stillPending.size()) + " pending");

    return stillPending;
}

EntityState ExportPoller::evaluate(const Entity& entity, std::vector<Dispatched>& dispatched, bool& calledRemote) {
    if (layout.hasArtifact(entity)) {
        logger.info("Entity " + describe(entity) + " already has its artifact. Skipping...");
        return EntityState::ArtifactPresent;
    }

    logger.info("Processing entity " + describe(entity));
    calledRemote = true;

    std::vector<ExportJob> jobs;
    ApiResult listed = api.listExports(entity.id, jobs);
    if (!checkCredentials(entity, "list", listed))
        return EntityState::PendingCheck;
    if (!listed.ok) {
        logger.error("Cannot list exports for entity " + describe(entity) + ": " + listed.error);
        return EntityState::PendingCheck;
    }

    auto ready = selectReady(jobs, opts.cutoff);
    if (!ready)
        return requestExport(entity, jobs);

    return dispatch(entity, *ready, dispatched);
}

EntityState ExportPoller::requestExport(const Entity& entity, const std::vector<ExportJob>& jobs) {
    if (opts.awaitInFlight) {
        const bool inFlight = std::any_of(jobs.begin(), jobs.end(), [this](const ExportJob& job) {
            return job.state == WorkflowState::Queued && job.createdAt >= opts.cutoff;
            });
        if (inFlight) {
            logger.info("Export for entity " + describe(entity) + " is still being prepared");
            return EntityState::ExportRequested;
        }
    }

    logger.info("No usable export for entity " + describe(entity) + ". Creating a new export...");

    ApiResult created = api.createExport(entity.id);
    if (!checkCredentials(entity, "create", created))
        return EntityState::PendingCheck;
    if (created.ok)
        logger.info("Export created for entity " + describe(entity));
    else
        logger.error("Cannot create export for entity " + describe(entity) + ": " + created.error);

    return EntityState::ExportRequested;
}

EntityState ExportPoller::dispatch(const Entity& entity, const ExportJob& job, std::vector<Dispatched>& dispatched) {
    DownloadTask task{};
    task.entityId = entity.id;
    task.url = job.attachment->url;
    task.attempt = ++dispatchCount[entity.id];

    if (!layout.destinationFor(entity, job.attachment->filename, task.destination)) {
        logger.error("Cannot create folder " + layout.folderFor(entity) + " for entity " + describe(entity));
        return EntityState::TerminalFailure;
    }

    logger.info("Queueing download of " + task.destination);

    TransferRunner runner = runTransfer;
    Dispatched d{ entity, scheduler.submit([runner, task]() { return runner(task); }) };
    dispatched.push_back(std::move(d));
    return EntityState::ExportReady;
}

void ExportPoller::awaitTransfers(std::vector<Dispatched>& dispatched) {
    for (auto& d : dispatched) {
        TransferReport rep{};
        rep.entityId = d.entity.id;

        try {
            rep = d.done.get();
        }
        catch (const std::exception& ex) {
            rep.success = false;
            rep.errorKind = TransferErrorKind::RetryBudgetExhausted;
            rep.error = ex.what();
        }

        if (rep.success) {
            states[d.entity.id] = EntityState::ArtifactPresent;
            if (progress)
                progress->transferSucceeded();
            logger.info("Downloaded artifact for entity " + describe(d.entity) + " (" +
                std::to_string(rep.bytesWritten) + " bytes, " +
                std::to_string(rep.attempts) + " attempt(s))");
        }
        else {
            states[d.entity.id] = EntityState::TerminalFailure;
            if (progress)
                progress->transferFailed();
            logger.error("Download failed for entity " + describe(d.entity) + ": " +
                toString(rep.errorKind) + ": " + rep.error);
        }
    }
    dispatched.clear();
}

bool ExportPoller::checkCredentials(const Entity& entity, const char* call, const ApiResult& result) {
    if (!result.unauthorized())
        return true;

    rejection = "export " + std::string(call) + " for entity " + describe(entity) +
        " rejected the credentials (HTTP " + std::to_string(result.httpStatus) + ")";
    return false;
}

bool ExportPoller::stopRequested() const {
    return externalStopSignal && *externalStopSignal != 0;
}

void ExportPoller::pause(std::uint64_t ms) const {
    while (ms > 0 && !stopRequested()) {
        const std::uint64_t slice = std::min(ms, kPauseSliceMs);
        std::this_thread::sleep_for(std::chrono::milliseconds(slice));
        ms -= slice;
    }
}
