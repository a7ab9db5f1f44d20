#pragma once
#include <queue>
#include <memory>
#include <mutex>
#include <string>
#include <cstddef>

#include "../net/HttpClient.h"

// Keeps idle HttpClients (and their open connections) for reuse by
// concurrent transfers.
class ConnectionPool {
public:
    ConnectionPool(const std::string& token, std::size_t maxIdle);

    std::unique_ptr<HttpClient> acquire();
    void release(std::unique_ptr<HttpClient> client);

private:
    std::string apiToken;
    std::size_t maxPoolSize;
    std::queue<std::unique_ptr<HttpClient>> pool;
    std::mutex mtx;
};
