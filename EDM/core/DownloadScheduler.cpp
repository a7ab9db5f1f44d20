#include "DownloadScheduler.h"

#include <algorithm>

DownloadScheduler::DownloadScheduler(std::size_t capacity)
    : slots(std::max<std::size_t>(capacity, 1)) {
    std::lock_guard<std::mutex> lock(mtx);

    for (std::size_t i = 0; i < slots; ++i) {
        threads.emplace_back(&DownloadScheduler::workerLoop, this);
    }
}

DownloadScheduler::~DownloadScheduler() {
    shutdown();
}

void DownloadScheduler::enqueue(TaskBody job) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping)
            return;
        waiting.push_back(std::move(job));
    }
    cv.notify_one();
}

void DownloadScheduler::workerLoop() {
    std::unique_lock<std::mutex> lock(mtx);

    for (;;) {
        cv.wait(lock, [this]() {
            return !waiting.empty() || stopping;
            });

        if (waiting.empty())
            return;

        // The slot goes to the oldest waiter while the lock is still held
        TaskBody job = std::move(waiting.front());
        waiting.pop_front();
        ++running;

        lock.unlock();
        job();
        lock.lock();

        --running;
    }
}

void DownloadScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    cv.notify_all();

    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }

    threads.clear();
}

std::size_t DownloadScheduler::active() const {
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}
