#ifndef OMNISTORE_SRC_LAYERS_RETRY_POLICY_HPP_
#define OMNISTORE_SRC_LAYERS_RETRY_POLICY_HPP_

#include "app_constants.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace OmniStore::Layers
{

struct RetryPolicy {
    std::uint32_t max_attempts           = Constants::DEFAULT_RETRY_MAX_ATTEMPTS;
    std::chrono::milliseconds base_delay = Constants::DEFAULT_RETRY_BASE_DELAY;
    std::chrono::milliseconds max_delay  = Constants::DEFAULT_RETRY_MAX_DELAY;
    bool jitter                          = true;

    bool IsValid() const { return max_attempts >= 1 && base_delay.count() >= 0 && max_delay >= base_delay; }
};

/**
 * @brief Delay before retry number `attempt` (1 based).
 *
 * base_delay * 2^(attempt - 1), scaled by a factor in [0.5, 1.5) taken from
 * `jitter_sample` (expected in [0, 1)) when jitter is on, and clamped to
 * max_delay.
 */
std::chrono::milliseconds ComputeBackoff(
    const RetryPolicy& policy, std::uint32_t attempt, double jitter_sample
);

// Sleeps for `delay` unless `cancel` fires first. Returns false if cancelled.
using Sleeper = std::function<bool(std::chrono::milliseconds delay, std::stop_token cancel)>;

// Uniform sample in [0, 1)
using JitterSource = std::function<double()>;

bool InterruptibleSleep(std::chrono::milliseconds delay, std::stop_token cancel);
double DefaultJitter();

}  // namespace OmniStore::Layers

#endif  // OMNISTORE_SRC_LAYERS_RETRY_POLICY_HPP_
