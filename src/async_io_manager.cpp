#include "async_io_manager.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace OmniStore
{

AsyncIoManager::AsyncIoManager(size_t num_threads)
{
    const size_t count = std::max<size_t>(num_threads, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            WorkerLoop(stop);
        });
    }
    spdlog::debug("AsyncIoManager started with {} worker threads", count);
}

AsyncIoManager::~AsyncIoManager()
{
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // jthread joins on destruction
    workers_.clear();
    spdlog::debug("AsyncIoManager stopped");
}

void AsyncIoManager::WorkerLoop(std::stop_token stop)
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            // Returns false only when stopping with nothing left to drain
            if (!queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("AsyncIoManager: task threw: {}", e.what());
        }
    }
}

void AsyncIoManager::SubmitTask(std::function<void()>&& task)
{
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) {
            throw std::runtime_error("AsyncIoManager is shutting down");
        }
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

}  // namespace OmniStore
