#include "ExportController.h"

#include <sstream>
#include <iomanip>

#include "ResumableTransfer.h"
#include "../api/EntityCatalog.h"
#include "../io/EntityFilter.h"

ExportController::ExportController(const ExportConfig& config, volatile std::sig_atomic_t* externalStop)
    : cfg(config),
    externalStopSignal(externalStop)
{
}

bool ExportController::start() {
    logger.start();
    progress.reset();

    apiClient = std::make_unique<HttpClient>(cfg.apiToken);

    std::vector<Entity> entities;
    if (!loadEntities(entities)) {
        stop();
        return false;
    }

    connectionPool = std::make_unique<ConnectionPool>(cfg.apiToken, cfg.maxConcurrent);
    exportApi = std::make_unique<RestExportApi>(*apiClient, cfg.apiBase, cfg.exportType, logger);
    layout = std::make_unique<ArtifactLayout>(cfg.rootDir, cfg.artifactSuffix);
    scheduler = std::make_unique<DownloadScheduler>(cfg.maxConcurrent);

    PollOptions options{};
    options.cutoff = cfg.cutoff;
    options.pollIntervalMs = cfg.pollIntervalMs;
    options.checkDelayMs = cfg.checkDelayMs;
    options.awaitInFlight = cfg.awaitInFlight;

    poller = std::make_unique<ExportPoller>(
        *exportApi,
        *layout,
        *scheduler,
        [this](const DownloadTask& task) {
            return runTransfer(task);
        },
        options,
        logger,
        &progress,
        externalStopSignal);

    const bool drained = poller->run(entities);

    logSummary(drained, entities.size());

    stop();
    return drained;
}

void ExportController::stop() {
    // Transfers already admitted still run to completion
    if (scheduler)
        scheduler->shutdown();

    logger.stop();
}

bool ExportController::loadEntities(std::vector<Entity>& out) {
    HttpClient& client = *apiClient;
    EntityCatalog catalog(cfg, [&client](const std::string& url, HttpResponse& res) {
        return client.get(url, res);
        }, logger);

    std::vector<Entity> all;
    if (!catalog.load(all)) {
        logger.error("Cannot obtain the entity listing: " + catalog.lastError());
        return false;
    }
    logger.info("Found " + std::to_string(all.size()) + " entities.");

    EntityFilter filter;
    if (!cfg.filterCsv.empty()) {
        std::string error;
        if (!filter.loadCsv(cfg.filterCsv, cfg.filterColumn, error)) {
            logger.error("Cannot read entity filter: " + error);
            return false;
        }
        logger.info("Loaded " + std::to_string(filter.codeCount()) + " entity codes from " + cfg.filterCsv);
    }
    filter.setMinStart(cfg.minStartDate);

    out = filter.apply(all);
    logger.info("Entities to export: " + std::to_string(out.size()));
    return true;
}

TransferReport ExportController::runTransfer(const DownloadTask& task) {
    RetryPolicy policy{};
    policy.maxRetries = cfg.maxRetries;
    policy.backoffBaseMs = cfg.backoffBaseMs;
    policy.backoffCapMs = cfg.backoffCapMs;

    auto client = connectionPool->acquire();

    ResumableTransfer transfer(*client, policy, logger, &progress);
    TransferReport rep = transfer.run(task);

    connectionPool->release(std::move(client));
    return rep;
}

void ExportController::logSummary(bool drained, std::size_t entityCount) {
    const double seconds = progress.elapsedSeconds();
    const double avgSpeed = progress.speedBytesPerSec();

    const char* outcome = drained ? "completed" : "stopped";
    if (poller && poller->credentialsRejected())
        outcome = "aborted";

    std::ostringstream conclusion;
    conclusion << "Export run "
        << outcome
        << " after " << (poller ? poller->rounds() : 0) << " round(s) in "
        << std::fixed << std::setprecision(2) << seconds << "s, "
        << progress.downloaded() << " bytes, avg speed "
        << std::setprecision(2) << (avgSpeed * 8.0 / 1'000'000.0)
        << " Mbps, transfers " << progress.succeeded() << " ok / "
        << progress.failed() << " failed, entities " << entityCount;

    if (drained)
        logger.info(conclusion.str());
    else
        logger.warn(conclusion.str());
}
