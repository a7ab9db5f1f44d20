#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>

class ProgressTracker {
public:
    ProgressTracker();

    void add(std::uint64_t bytes);
    void transferSucceeded();
    void transferFailed();

    std::uint64_t downloaded() const;
    std::uint64_t succeeded() const;
    std::uint64_t failed() const;

    double elapsedSeconds() const;
    double speedBytesPerSec() const;
    void reset();

private:
    std::atomic<std::uint64_t> current{ 0 };
    std::atomic<std::uint64_t> okCount{ 0 };
    std::atomic<std::uint64_t> failCount{ 0 };
    std::chrono::steady_clock::time_point start;
};
