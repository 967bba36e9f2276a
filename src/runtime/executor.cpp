#include "triple/runtime/executor.hpp"

#include <algorithm>
#include <exception>

namespace triple::runtime
{

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t core_threads,
                                       std::size_t max_threads,
                                       std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , max_threads_(std::max<std::size_t>({1, core_threads, max_threads}))
{
    std::lock_guard lock(mutex_);
    for (std::size_t i = 0; i < std::max<std::size_t>(1, core_threads); ++i) {
        spawn_locked();
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    stop();
}

std::size_t ThreadPoolExecutor::worker_count() const
{
    std::lock_guard lock(mutex_);
    return workers_.size();
}

void ThreadPoolExecutor::spawn_locked()
{
    workers_.emplace_back([this] { worker_loop(); });
    if (logger_ && workers_.size() > 1) {
        logger_->debug("executor grew to {} workers", workers_.size());
    }
}

void ThreadPoolExecutor::stop()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    cv_.notify_all();
    for (auto& worker : workers) {
        if (!worker.joinable()) {
            continue;
        }
        // A task may stop the pool that runs it.
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

void ThreadPoolExecutor::schedule(std::function<void()> fn)
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            if (logger_) {
                logger_->warn("executor stopped, task dropped");
            }
            return;
        }
        tasks_.push(std::move(fn));
        if (idle_ < tasks_.size() && workers_.size() < max_threads_) {
            spawn_locked();
        }
    }
    cv_.notify_one();
}

void ThreadPoolExecutor::worker_loop()
{
    std::unique_lock lock(mutex_);
    while (true) {
        ++idle_;
        cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        --idle_;
        if (tasks_.empty()) {
            return;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop();

        lock.unlock();
        try {
            task();
        } catch (const std::exception& ex) {
            if (logger_) {
                logger_->error("executor task threw exception: {}", ex.what());
            }
        }
        task = nullptr;
        lock.lock();
    }
}

}  // namespace triple::runtime
