#pragma once

#include <spdlog/logger.h>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace triple::runtime
{

// Runs server handlers. schedule() must not run the task on the calling
// thread: handlers block on frames that the caller, a connection reader,
// has yet to deliver.
class Executor
{
public:
    virtual ~Executor() = default;
    virtual void schedule(std::function<void()> fn) = 0;
};

// Starts with `core_threads` workers and adds one whenever a task arrives with
// no idle worker, up to `max_threads`. Stream handlers occupy a worker for the
// whole life of the stream, so a fixed pool would starve new calls.
// Tasks still queued when stop() is called are run before the workers exit.
class ThreadPoolExecutor : public Executor
{
public:
    ThreadPoolExecutor(std::size_t core_threads, std::size_t max_threads, std::shared_ptr<spdlog::logger> logger);
    ~ThreadPoolExecutor() override;

    void schedule(std::function<void()> fn) override;
    void stop();

    std::size_t worker_count() const;

private:
    void spawn_locked();
    void worker_loop();

    std::shared_ptr<spdlog::logger> logger_;
    std::size_t max_threads_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t idle_ = 0;
    bool stopping_ = false;
};

}  // namespace triple::runtime
