#include "Logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::string timestampPrefix() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream os;
    os << std::put_time(&local, "%H:%M:%S");
    return os.str();
}

const char* levelTag(Logger::Level level) {
    switch (level) {
    case Logger::Level::Warn:  return "WARN ";
    case Logger::Level::Error: return "ERROR";
    default:                   return "INFO ";
    }
}
}

Logger::Logger() {}

Logger::~Logger() {
    stop();

    // Never started: print whatever was queued
    std::queue<Entry> leftover;
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::swap(leftover, messages);
    }
    flush(leftover);
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void Logger::log(Level level, const std::string& msg) {
    Entry entry{ level, timestampPrefix() + " " + levelTag(level) + " " + msg };
    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(std::move(entry));
    }
    cv.notify_one();
}

void Logger::run() {
    for (;;) {
        std::queue<Entry> pending;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait(lock, [&]() {
                return !messages.empty() || !running.load();
                });

            if (messages.empty() && !running.load())
                return;

            std::swap(pending, messages);
        }
        flush(pending);
    }
}

void Logger::flush(std::queue<Entry>& pending) {
    while (!pending.empty()) {
        const Entry& e = pending.front();
        if (e.level == Level::Info)
            std::cout << e.text << std::endl;
        else
            std::cerr << e.text << std::endl;
        pending.pop();
    }
}
