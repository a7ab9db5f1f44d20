#pragma once
#include <memory>
#include <vector>
#include <csignal>

#include "utils.h"
#include "ConnectionPool.h"
#include "DownloadScheduler.h"
#include "ExportPoller.h"
#include "../api/RestExportApi.h"
#include "../io/ArtifactLayout.h"
#include "../net/HttpClient.h"
#include "../monitor/ProgressTracker.h"
#include "../monitor/Logger.h"

class ExportController {
public:
    explicit ExportController(const ExportConfig& config, volatile std::sig_atomic_t* externalStop = nullptr);

    // false on a setup failure or when stopped before every artifact landed
    bool start();
    void stop();

private:
    bool loadEntities(std::vector<Entity>& out);
    TransferReport runTransfer(const DownloadTask& task);
    void logSummary(bool drained, std::size_t entityCount);

private:
    const ExportConfig& cfg;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    // Declared first so they outlive the scheduler's workers
    Logger logger;
    ProgressTracker progress;

    std::unique_ptr<HttpClient> apiClient;
    std::unique_ptr<ConnectionPool> connectionPool;
    std::unique_ptr<RestExportApi> exportApi;
    std::unique_ptr<ArtifactLayout> layout;
    std::unique_ptr<DownloadScheduler> scheduler;
    std::unique_ptr<ExportPoller> poller;
};
