#pragma once
#include <vector>
#include <deque>
#include <thread>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <cstddef>

// Runs submitted task bodies on at most `capacity` threads at once.
// Waiting bodies start in submission order. A body's result or exception is
// delivered only through the future returned by submit().
class DownloadScheduler {
public:
    using TaskBody = std::function<void()>;

    explicit DownloadScheduler(std::size_t capacity);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    template <typename Fn>
    auto submit(Fn body) -> std::future<decltype(body())> {
        using Result = decltype(body());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(body));
        auto handle = task->get_future();
        // A rejected task is destroyed unrun; its future then reports broken_promise
        enqueue([task]() { (*task)(); });
        return handle;
    }

    // Finishes every queued body, then joins the workers.
    void shutdown();

    std::size_t capacity() const { return slots; }
    std::size_t active() const;

private:
    void enqueue(TaskBody job);
    void workerLoop();

private:
    const std::size_t slots;
    std::vector<std::thread> threads;
    std::deque<TaskBody> waiting;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::size_t running{ 0 };
    bool stopping{ false };
};
