#ifndef OMNISTORE_SRC_ASYNC_IO_MANAGER_HPP_
#define OMNISTORE_SRC_ASYNC_IO_MANAGER_HPP_

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace OmniStore
{

// Fixed pool of worker threads draining a FIFO task queue. Pending tasks are
// still run on destruction before the workers join.
class AsyncIoManager
{
    public:
    explicit AsyncIoManager(size_t num_threads = std::thread::hardware_concurrency());
    ~AsyncIoManager();

    AsyncIoManager(const AsyncIoManager&)            = delete;
    AsyncIoManager& operator=(const AsyncIoManager&) = delete;

    // Runs `fn` on a worker; its result (or exception) arrives via the future
    template <typename Fn>
    std::future<std::invoke_result_t<std::decay_t<Fn>>> Submit(Fn&& fn)
    {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto job     = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto result  = job->get_future();
        SubmitTask([job]() {
            (*job)();
        });
        return result;
    }

    // Throws std::runtime_error once shutdown has begun
    void SubmitTask(std::function<void()>&& task);

    size_t ThreadCount() const noexcept { return workers_.size(); }

    private:
    void WorkerLoop(std::stop_token stop);

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<std::function<void()>> queue_;
    bool accepting_ = true;

    std::vector<std::jthread> workers_;
};

}  // namespace OmniStore

#endif  // OMNISTORE_SRC_ASYNC_IO_MANAGER_HPP_
