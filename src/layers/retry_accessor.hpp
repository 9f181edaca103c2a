#ifndef OMNISTORE_SRC_LAYERS_RETRY_ACCESSOR_HPP_
#define OMNISTORE_SRC_LAYERS_RETRY_ACCESSOR_HPP_

#include "layers/retry_policy.hpp"
#include "storage/i_accessor.hpp"

#include <memory>

namespace OmniStore::Layers
{

using Storage::StorageResult;

// Policy plus the clock-like hooks, shared by the accessor and the streams it
// hands out so those keep working after the accessor is gone.
class RetryContext
{
    public:
    RetryContext(RetryPolicy policy, Sleeper sleeper, JitterSource jitter);

    const RetryPolicy& Policy() const { return policy_; }

    /**
     * @brief Decides what happens after attempt number `attempt` failed.
     *
     * Returns the error to surface when it is not retryable or the attempt
     * budget is spent. Otherwise sleeps for the backoff delay and returns
     * success, meaning the caller should try again. Cancellation is checked
     * before the sleep starts and wakes it early.
     */
    StorageResult<void> Backoff(
        const Storage::StorageError& error, std::uint32_t attempt, const std::stop_token& cancel
    ) const;

    private:
    const RetryPolicy policy_;
    Sleeper sleeper_;
    JitterSource jitter_;
};

/**
 * @brief Accessor layer that absorbs RateLimited and Unavailable failures.
 *
 * Every operation is re-invoked up to policy.max_attempts times. Readers are
 * wrapped so that a mid-stream failure reopens the object at the first byte
 * not yet delivered; listers are wrapped so that Next() is repeated. A write
 * is only retried when its input reader can be rewound, otherwise a transient
 * failure is surfaced as Unexpected after the single attempt.
 */
class RetryAccessor : public Storage::IAccessor
{
    public:
    RetryAccessor(
        std::shared_ptr<Storage::IAccessor> inner, RetryPolicy policy,
        Sleeper sleeper = InterruptibleSleep, JitterSource jitter = DefaultJitter
    );

    RetryAccessor(const RetryAccessor&)            = delete;
    RetryAccessor& operator=(const RetryAccessor&) = delete;

    [[nodiscard]] Storage::AccessorInfo Info() const override { return inner_->Info(); }

    StorageResult<std::unique_ptr<Io::IReader>> Read(const Storage::ReadArgs& args) override;
    StorageResult<Storage::ObjectMetadata> Write(
        const Storage::WriteArgs& args, Io::IReader& reader
    ) override;
    StorageResult<void> Delete(const Storage::DeleteArgs& args) override;
    StorageResult<Storage::ObjectMetadata> Stat(const Storage::StatArgs& args) override;
    StorageResult<std::unique_ptr<Io::ILister>> List(const Storage::ListArgs& args) override;
    StorageResult<void> CreateDir(const Storage::CreateDirArgs& args) override;

    StorageResult<void> Authorize(const Credential::Credential& credential) override
    {
        return inner_->Authorize(credential);
    }

    const RetryPolicy& Policy() const { return context_->Policy(); }

    private:
    template <typename Fn>
    auto RunWithRetry(const std::stop_token& cancel, Storage::Operation op, const Storage::ObjectId& id, Fn&& fn)
        -> decltype(fn());

    std::shared_ptr<Storage::IAccessor> inner_;
    std::shared_ptr<const RetryContext> context_;
};

}  // namespace OmniStore::Layers

#endif  // OMNISTORE_SRC_LAYERS_RETRY_ACCESSOR_HPP_
