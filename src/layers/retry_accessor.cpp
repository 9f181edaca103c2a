#include "layers/retry_accessor.hpp"
#include "io/limited_reader.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace OmniStore::Layers
{

using Storage::MakeError;
using Storage::ObjectMetadata;
using Storage::Operation;
using Storage::StorageErrc;
using Storage::StorageError;

//------------------------------------------------------------------------------//
// RetryContext
//------------------------------------------------------------------------------//

RetryContext::RetryContext(RetryPolicy policy, Sleeper sleeper, JitterSource jitter)
    : policy_(policy), sleeper_(std::move(sleeper)), jitter_(std::move(jitter))
{
    if (!policy_.IsValid()) {
        throw std::invalid_argument("RetryPolicy requires max_attempts >= 1 and base_delay <= max_delay.");
    }
    if (!sleeper_ || !jitter_) {
        throw std::invalid_argument("RetryContext requires a sleeper and a jitter source.");
    }
}

StorageResult<void> RetryContext::Backoff(
    const StorageError& error, std::uint32_t attempt, const std::stop_token& cancel
) const
{
    if (!error.IsRetryable()) {
        return std::unexpected(error);
    }
    if (attempt >= policy_.max_attempts) {
        spdlog::warn(
            "RetryAccessor: giving up after {} attempts: {}", attempt, error.ToString()
        );
        return std::unexpected(error);
    }
    if (cancel.stop_requested()) {
        return Storage::MakeCancelledError(error.Op(), error.Path());
    }

    auto delay = ComputeBackoff(policy_, attempt, policy_.jitter ? jitter_() : 0.5);
    spdlog::warn(
        "RetryAccessor: attempt {}/{} failed, retrying in {} ms: {}", attempt,
        policy_.max_attempts, delay.count(), error.ToString()
    );
    if (!sleeper_(delay, cancel)) {
        return Storage::MakeCancelledError(error.Op(), error.Path());
    }
    return {};
}

namespace
{

//------------------------------------------------------------------------------//
// RetryingReader
//------------------------------------------------------------------------------//

// Reopens the object past the bytes already delivered when a read fails
class RetryingReader : public Io::IReader
{
    public:
    RetryingReader(
        std::shared_ptr<Storage::IAccessor> accessor, std::shared_ptr<const RetryContext> context,
        Storage::ReadArgs args, std::unique_ptr<Io::IReader> current
    )
        : accessor_(std::move(accessor)),
          context_(std::move(context)),
          args_(std::move(args)),
          current_(std::move(current))
    {
    }

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override
    {
        std::uint32_t attempt = 1;
        while (true) {
            if (args_.cancel.stop_requested()) {
                current_.reset();
                return Storage::MakeCancelledError(Operation::Read, args_.id.Str());
            }

            if (!current_) {
                auto reopen_res = Reopen();
                if (!reopen_res) {
                    if (auto backoff = context_->Backoff(reopen_res.error(), attempt, args_.cancel);
                        !backoff) {
                        return std::unexpected(backoff.error());
                    }
                    ++attempt;
                    continue;
                }
            }

            auto read_res = current_->Read(buffer);
            if (read_res) {
                consumed_ += *read_res;
                return read_res;
            }

            current_.reset();
            if (auto backoff = context_->Backoff(read_res.error(), attempt, args_.cancel); !backoff) {
                return std::unexpected(backoff.error());
            }
            ++attempt;
        }
    }

    // Restarting is just reopening from the first byte of the window
    bool IsSeekable() const override { return true; }

    StorageResult<void> Rewind() override
    {
        current_.reset();
        consumed_ = 0;
        return {};
    }

    private:
    StorageResult<void> Reopen()
    {
        const Storage::BytesRange window = args_.range.value_or(Storage::BytesRange{});
        spdlog::debug(
            "RetryAccessor: reopening '{}' at offset {}", args_.id.Str(), window.offset + consumed_
        );

        Storage::ReadArgs reopen_args = args_;
        if (consumed_ == 0) {
            reopen_args.range = args_.range;
        } else if (accessor_->Info().capability.range_read) {
            reopen_args.range = window.Advance(consumed_);
        } else {
            // Only unranged reads reach a backend without range support
            reopen_args.range.reset();
        }

        auto open_res = accessor_->Read(reopen_args);
        if (!open_res) {
            return std::unexpected(open_res.error());
        }

        current_ = std::move(*open_res);
        if (consumed_ != 0 && !reopen_args.range) {
            current_ = Io::LimitedReader::Create(
                std::move(current_), Storage::BytesRange{consumed_, std::nullopt}, args_.id.Str()
            );
        }
        return {};
    }

    std::shared_ptr<Storage::IAccessor> accessor_;
    std::shared_ptr<const RetryContext> context_;
    Storage::ReadArgs args_;
    std::unique_ptr<Io::IReader> current_;
    std::uint64_t consumed_ = 0;
};

//------------------------------------------------------------------------------//
// RetryingLister
//------------------------------------------------------------------------------//

// Repeats Next(); the inner lister keeps its continuation on failure
class RetryingLister : public Io::ILister
{
    public:
    RetryingLister(
        std::unique_ptr<Io::ILister> inner, std::shared_ptr<const RetryContext> context,
        std::stop_token cancel
    )
        : inner_(std::move(inner)), context_(std::move(context)), cancel_(std::move(cancel))
    {
    }

    StorageResult<std::optional<Storage::DirEntry>> Next() override
    {
        for (std::uint32_t attempt = 1;; ++attempt) {
            auto next_res = inner_->Next();
            if (next_res) {
                return next_res;
            }
            if (auto backoff = context_->Backoff(next_res.error(), attempt, cancel_); !backoff) {
                return std::unexpected(backoff.error());
            }
        }
    }

    private:
    std::unique_ptr<Io::ILister> inner_;
    std::shared_ptr<const RetryContext> context_;
    std::stop_token cancel_;
};

}  // anonymous namespace

//------------------------------------------------------------------------------//
// RetryAccessor
//------------------------------------------------------------------------------//

RetryAccessor::RetryAccessor(
    std::shared_ptr<Storage::IAccessor> inner, RetryPolicy policy, Sleeper sleeper,
    JitterSource jitter
)
    : inner_(std::move(inner)),
      context_(std::make_shared<const RetryContext>(policy, std::move(sleeper), std::move(jitter)))
{
    if (!inner_) {
        throw std::invalid_argument("RetryAccessor requires an inner accessor.");
    }
}

template <typename Fn>
auto RetryAccessor::RunWithRetry(
    const std::stop_token& cancel, Operation op, const Storage::ObjectId& id, Fn&& fn
) -> decltype(fn())
{
    for (std::uint32_t attempt = 1;; ++attempt) {
        if (cancel.stop_requested()) {
            return Storage::MakeCancelledError(op, id.Str());
        }
        auto result = fn();
        if (result) {
            return result;
        }
        if (auto backoff = context_->Backoff(result.error(), attempt, cancel); !backoff) {
            return std::unexpected(backoff.error());
        }
    }
}

StorageResult<std::unique_ptr<Io::IReader>> RetryAccessor::Read(const Storage::ReadArgs& args)
{
    auto open_res = RunWithRetry(args.cancel, Operation::Read, args.id, [&] {
        return inner_->Read(args);
    });
    if (!open_res) {
        return std::unexpected(open_res.error());
    }
    return std::make_unique<RetryingReader>(inner_, context_, args, std::move(*open_res));
}

StorageResult<ObjectMetadata> RetryAccessor::Write(const Storage::WriteArgs& args, Io::IReader& reader)
{
    const bool restartable = reader.IsSeekable();
    bool first_attempt     = true;

    return RunWithRetry(args.cancel, Operation::Write, args.id, [&]() -> StorageResult<ObjectMetadata> {
        if (!first_attempt) {
            if (auto rewind_res = reader.Rewind(); !rewind_res) {
                return MakeError(
                    StorageErrc::Unexpected, Operation::Write, args.id.Str(),
                    "could not rewind input for retry: " + rewind_res.error().Detail()
                );
            }
        }
        first_attempt = false;

        auto write_res = inner_->Write(args, reader);
        if (!write_res && write_res.error().IsRetryable() && !restartable) {
            spdlog::error(
                "RetryAccessor: write to '{}' failed transiently with a non-restartable input: {}",
                args.id.Str(), write_res.error().ToString()
            );
            return std::unexpected(write_res.error().WithKind(
                StorageErrc::Unexpected, "input stream is not restartable, write not retried"
            ));
        }
        return write_res;
    });
}

StorageResult<void> RetryAccessor::Delete(const Storage::DeleteArgs& args)
{
    return RunWithRetry(args.cancel, Operation::Delete, args.id, [&] {
        return inner_->Delete(args);
    });
}

StorageResult<ObjectMetadata> RetryAccessor::Stat(const Storage::StatArgs& args)
{
    return RunWithRetry(args.cancel, Operation::Stat, args.id, [&] {
        return inner_->Stat(args);
    });
}

StorageResult<std::unique_ptr<Io::ILister>> RetryAccessor::List(const Storage::ListArgs& args)
{
    auto list_res = RunWithRetry(args.cancel, Operation::List, args.id, [&] {
        return inner_->List(args);
    });
    if (!list_res) {
        return std::unexpected(list_res.error());
    }
    return std::make_unique<RetryingLister>(std::move(*list_res), context_, args.cancel);
}

StorageResult<void> RetryAccessor::CreateDir(const Storage::CreateDirArgs& args)
{
    return RunWithRetry(args.cancel, Operation::CreateDir, args.id, [&] {
        return inner_->CreateDir(args);
    });
}

}  // namespace OmniStore::Layers
