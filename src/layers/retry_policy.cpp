#include "layers/retry_policy.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <random>

namespace OmniStore::Layers
{

std::chrono::milliseconds ComputeBackoff(
    const RetryPolicy& policy, std::uint32_t attempt, double jitter_sample
)
{
    auto delay         = static_cast<double>(policy.base_delay.count());
    const auto ceiling = static_cast<double>(policy.max_delay.count());

    for (std::uint32_t i = 1; i < attempt && delay < ceiling; ++i) {
        delay *= 2.0;
    }

    if (policy.jitter) {
        delay *= 0.5 + std::clamp(jitter_sample, 0.0, 1.0);
    }

    delay = std::min(delay, ceiling);
    return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

bool InterruptibleSleep(std::chrono::milliseconds delay, std::stop_token cancel)
{
    if (cancel.stop_requested()) {
        return false;
    }
    if (delay.count() <= 0) {
        return true;
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, cancel, delay, [] {
        return false;
    });
    return !cancel.stop_requested();
}

double DefaultJitter()
{
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    return dis(gen);
}

}  // namespace OmniStore::Layers
