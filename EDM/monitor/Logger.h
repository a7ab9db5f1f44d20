#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>

class Logger {
public:
    enum class Level {
        Info,
        Warn,
        Error
    };

    Logger();
    ~Logger();

    void start();
    void stop();

    void log(Level level, const std::string& msg);

    void info(const std::string& msg) { log(Level::Info, msg); }
    void warn(const std::string& msg) { log(Level::Warn, msg); }
    void error(const std::string& msg) { log(Level::Error, msg); }

private:
    struct Entry {
        Level level;
        std::string text;
    };

    void run();
    void flush(std::queue<Entry>& pending);

private:
    std::queue<Entry> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
