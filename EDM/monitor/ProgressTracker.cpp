#include "ProgressTracker.h"

ProgressTracker::ProgressTracker()
    : start(std::chrono::steady_clock::now()) {
}

void ProgressTracker::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressTracker::transferSucceeded() {
    okCount.fetch_add(1, std::memory_order_relaxed);
}

void ProgressTracker::transferFailed() {
    failCount.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::downloaded() const {
    return current.load(std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::succeeded() const {
    return okCount.load(std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::failed() const {
    return failCount.load(std::memory_order_relaxed);
}

double ProgressTracker::elapsedSeconds() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count();
}

double ProgressTracker::speedBytesPerSec() const {
    const double secs = elapsedSeconds();
    return secs > 0 ? downloaded() / secs : 0.0;
}

void ProgressTracker::reset() {
    current.store(0, std::memory_order_relaxed);
    okCount.store(0, std::memory_order_relaxed);
    failCount.store(0, std::memory_order_relaxed);
    start = std::chrono::steady_clock::now();
}
