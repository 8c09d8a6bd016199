// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace discofill {
namespace util {

ThreadPool::ThreadPool(std::string name, size_t num_threads)
    : name_(std::move(name)), stop_(false)
{
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 2;
        }
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

bool ThreadPool::post(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            LOG_WARN("ThreadPool '{}': dropping task posted after shutdown", name_);
            return false;
        }

        tasks_.emplace([pool_name = name_, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception &e) {
                LOG_ERROR("ThreadPool '{}': task failed: {}", pool_name, e.what());
            }
        });
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

} // namespace util
} // namespace discofill
