#include "operator/operator.hpp"
#include "layers/credential_accessor.hpp"
#include "layers/range_accessor.hpp"
#include "layers/retry_accessor.hpp"
#include "services/service_factory.hpp"
#include "storage/path_normalizer.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace OmniStore
{

using Storage::MakeError;
using Storage::ObjectId;
using Storage::ObjectMetadata;
using Storage::Operation;
using Storage::PathNormalizer;
using Storage::StorageErrc;
using Storage::StorageError;

namespace
{

// Readers and listers below may call back into the stack; these keep it alive

class StackBoundReader : public Io::IReader
{
    public:
    StackBoundReader(std::shared_ptr<Storage::IAccessor> stack, std::unique_ptr<Io::IReader> inner)
        : stack_(std::move(stack)), inner_(std::move(inner))
    {
    }

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override { return inner_->Read(buffer); }
    bool IsSeekable() const override { return inner_->IsSeekable(); }
    StorageResult<void> Rewind() override { return inner_->Rewind(); }

    private:
    std::shared_ptr<Storage::IAccessor> stack_;
    std::unique_ptr<Io::IReader> inner_;
};

class StackBoundLister : public Io::ILister
{
    public:
    StackBoundLister(std::shared_ptr<Storage::IAccessor> stack, std::unique_ptr<Io::ILister> inner)
        : stack_(std::move(stack)), inner_(std::move(inner))
    {
    }

    StorageResult<std::optional<Storage::DirEntry>> Next() override { return inner_->Next(); }

    private:
    std::shared_ptr<Storage::IAccessor> stack_;
    std::unique_ptr<Io::ILister> inner_;
};

std::unexpected<StorageError> Surface(const StorageError& error)
{
    if (error.Kind() == StorageErrc::Unexpected && !Storage::IsCancelled(error)) {
        spdlog::error("Operator: {}", error.ToString());
    } else {
        spdlog::debug("Operator: {}", error.ToString());
    }
    return std::unexpected(error);
}

std::shared_ptr<Credential::ICredentialResolver> MakeCredentialResolver(
    const Config::CredentialSettings& settings
)
{
    std::shared_ptr<Credential::ICredentialResolver> source;
    switch (settings.source) {
        case Config::CredentialSource::Static:
            source = std::make_shared<Credential::StaticCredentialResolver>(Credential::Credential{
                .access_key_id     = settings.access_key_id,
                .secret_access_key = settings.secret_access_key,
                .session_token     = settings.session_token,
                .region            = settings.region,
                .endpoint          = settings.endpoint,
            });
            break;
        case Config::CredentialSource::Env:
            source = std::make_shared<Credential::EnvCredentialResolver>();
            break;
        case Config::CredentialSource::None:
        default:
            return nullptr;
    }
    return std::make_shared<Credential::CachingCredentialResolver>(
        std::move(source), std::chrono::seconds(settings.cache_ttl_secs)
    );
}

}  // anonymous namespace

//------------------------------------------------------------------------------//
// Class Creation and Destruction
//------------------------------------------------------------------------------//

Operator::Operator(std::shared_ptr<Storage::IAccessor> stack, std::size_t io_threads)
    : stack_(std::move(stack)), info_(stack_->Info()), io_manager_(io_threads)
{
}

StorageResult<std::unique_ptr<Operator>> Operator::Create(
    std::shared_ptr<Storage::IAccessor> backend, OperatorOptions options
)
{
    if (!backend) {
        throw std::invalid_argument("Operator requires a backend accessor.");
    }

    const auto backend_info = backend->Info();
    std::shared_ptr<Storage::IAccessor> stack = std::move(backend);

    if (backend_info.capability.needs_credential) {
        if (!options.credential_resolver) {
            spdlog::error(
                "Operator: backend '{}' needs credentials but no resolver is configured",
                backend_info.name
            );
            return MakeError(
                StorageErrc::PermissionDenied, Operation::Stat, {},
                "backend requires credentials and no resolver is configured"
            );
        }
        stack = std::make_shared<Layers::CredentialAccessor>(
            std::move(stack), std::move(options.credential_resolver)
        );
    } else if (options.credential_resolver) {
        spdlog::debug(
            "Operator: backend '{}' takes no credentials, resolver ignored", backend_info.name
        );
    }

    stack = std::make_shared<Layers::RangeAccessor>(std::move(stack));

    if (options.retry) {
        if (!options.retry->IsValid()) {
            return MakeError(
                StorageErrc::InvalidInput, Operation::Stat, {}, "invalid retry policy"
            );
        }
        stack = std::make_shared<Layers::RetryAccessor>(
            std::move(stack), *options.retry, std::move(options.retry_sleeper),
            std::move(options.retry_jitter)
        );
    }

    spdlog::info(
        "Operator ready: scheme='{}', root='{}', retry={}", Storage::SchemeToString(backend_info.scheme),
        backend_info.root, options.retry.has_value()
    );
    return std::unique_ptr<Operator>(new Operator(std::move(stack), options.io_threads));
}

StorageResult<std::unique_ptr<Operator>> Operator::FromConfig(const Config::OperatorConfig& config)
{
    auto backend = Services::ServiceFactory::Create(config.service_definition);
    if (!backend) {
        spdlog::error("Operator: cannot create backend: {}", backend.error().ToString());
        return std::unexpected(backend.error());
    }

    OperatorOptions options;
    options.io_threads          = config.global_settings.io_threads;
    options.credential_resolver = MakeCredentialResolver(config.credential_settings);
    if (config.retry_settings.enabled) {
        options.retry = Layers::RetryPolicy{
            .max_attempts = config.retry_settings.max_attempts,
            .base_delay   = std::chrono::milliseconds(config.retry_settings.base_delay_ms),
            .max_delay    = std::chrono::milliseconds(config.retry_settings.max_delay_ms),
            .jitter       = config.retry_settings.jitter,
        };
    } else {
        options.retry.reset();
    }
    return Create(std::move(*backend), std::move(options));
}

//------------------------------------------------------------------------------//
// Dispatch Helpers
//------------------------------------------------------------------------------//

StorageResult<ObjectId> Operator::Prepare(std::string_view path, Operation op) const
{
    auto id = PathNormalizer::Normalize(path, op);
    if (!id) {
        return Surface(id.error());
    }
    if (auto cap = Storage::CheckCapability(info_.capability, op, *id); !cap) {
        return Surface(cap.error());
    }
    spdlog::debug("Operator: {} '{}'", Storage::OperationToString(op), id->Str());
    return id;
}

StorageResult<ObjectId> Operator::PrepareDir(std::string_view path, Operation op) const
{
    auto id = Prepare(path, op);
    if (!id || id->IsDir()) {
        return id;
    }
    return PathNormalizer::Normalize(id->Str() + "/", op);
}

//------------------------------------------------------------------------------//
// Synchronous Operations
//------------------------------------------------------------------------------//

StorageResult<std::unique_ptr<Io::IReader>> Operator::Read(
    std::string_view path, std::int64_t offset, std::optional<std::int64_t> length,
    std::stop_token cancel
)
{
    auto id = Prepare(path, Operation::Read);
    if (!id) {
        return std::unexpected(id.error());
    }

    auto range = Storage::MakeRange(offset, length, Operation::Read, id->Str());
    if (!range) {
        return Surface(range.error());
    }

    Storage::ReadArgs args{*id, std::nullopt, std::move(cancel)};
    if (!range->IsFull()) {
        if (!info_.capability.range_read) {
            return Surface(StorageError(
                StorageErrc::Unsupported, Operation::Read, id->Str(), "range reads not supported"
            ));
        }
        args.range = *range;
    }

    auto read_res = stack_->Read(args);
    if (!read_res) {
        return Surface(read_res.error());
    }
    return std::make_unique<StackBoundReader>(stack_, std::move(*read_res));
}

StorageResult<std::vector<std::byte>> Operator::ReadAll(
    std::string_view path, std::int64_t offset, std::optional<std::int64_t> length,
    std::stop_token cancel
)
{
    auto id = PathNormalizer::Normalize(path, Operation::Read);
    if (!id) {
        return Surface(id.error());
    }
    auto reader = Read(id->Str(), offset, length, cancel);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    auto data = Io::ReadToEnd(**reader, cancel, id->Str());
    if (!data) {
        return Surface(data.error());
    }
    return data;
}

StorageResult<ObjectMetadata> Operator::Write(
    std::string_view path, Io::IReader& reader, std::optional<std::uint64_t> size_hint,
    std::stop_token cancel
)
{
    auto id = Prepare(path, Operation::Write);
    if (!id) {
        return std::unexpected(id.error());
    }
    if (id->IsDir()) {
        return Surface(StorageError(
            StorageErrc::InvalidInput, Operation::Write, id->Str(), "cannot write to a directory path"
        ));
    }
    if (size_hint && info_.capability.max_write_size && *size_hint > *info_.capability.max_write_size) {
        return Surface(StorageError(
            StorageErrc::InvalidInput, Operation::Write, id->Str(),
            "size " + std::to_string(*size_hint) + " exceeds max_write_size " +
                std::to_string(*info_.capability.max_write_size)
        ));
    }

    auto write_res = stack_->Write(Storage::WriteArgs{*id, size_hint, std::move(cancel)}, reader);
    if (!write_res) {
        return Surface(write_res.error());
    }
    return write_res;
}

StorageResult<ObjectMetadata> Operator::Write(
    std::string_view path, std::span<const std::byte> data, std::stop_token cancel
)
{
    auto reader = Io::BufferReader::View(data);
    return Write(path, reader, data.size(), std::move(cancel));
}

StorageResult<void> Operator::Delete(std::string_view path, std::stop_token cancel)
{
    auto id = Prepare(path, Operation::Delete);
    if (!id) {
        return std::unexpected(id.error());
    }
    auto delete_res = stack_->Delete(Storage::DeleteArgs{*id, std::move(cancel)});
    if (!delete_res) {
        return Surface(delete_res.error());
    }
    return {};
}

StorageResult<ObjectMetadata> Operator::Stat(std::string_view path, std::stop_token cancel)
{
    auto id = Prepare(path, Operation::Stat);
    if (!id) {
        return std::unexpected(id.error());
    }
    auto stat_res = stack_->Stat(Storage::StatArgs{*id, std::move(cancel)});
    if (!stat_res) {
        return Surface(stat_res.error());
    }
    return stat_res;
}

StorageResult<bool> Operator::IsExist(std::string_view path, std::stop_token cancel)
{
    auto stat_res = Stat(path, std::move(cancel));
    if (stat_res) {
        return true;
    }
    if (stat_res.error().Kind() == StorageErrc::NotFound) {
        return false;
    }
    return std::unexpected(stat_res.error());
}

StorageResult<std::unique_ptr<Io::ILister>> Operator::List(std::string_view path, std::stop_token cancel)
{
    auto id = PrepareDir(path, Operation::List);
    if (!id) {
        return std::unexpected(id.error());
    }
    auto list_res = stack_->List(Storage::ListArgs{*id, std::move(cancel)});
    if (!list_res) {
        return Surface(list_res.error());
    }
    return std::make_unique<StackBoundLister>(stack_, std::move(*list_res));
}

StorageResult<std::vector<Storage::DirEntry>> Operator::ListAll(
    std::string_view path, std::stop_token cancel
)
{
    auto lister = List(path, cancel);
    if (!lister) {
        return std::unexpected(lister.error());
    }
    auto entries = Io::CollectAll(**lister, cancel);
    if (!entries) {
        return Surface(entries.error());
    }
    return entries;
}

StorageResult<void> Operator::CreateDir(std::string_view path, std::stop_token cancel)
{
    auto id = PrepareDir(path, Operation::CreateDir);
    if (!id) {
        return std::unexpected(id.error());
    }
    auto create_res = stack_->CreateDir(Storage::CreateDirArgs{*id, std::move(cancel)});
    if (!create_res) {
        return Surface(create_res.error());
    }
    return {};
}

//------------------------------------------------------------------------------//
// Asynchronous Operations
//------------------------------------------------------------------------------//

std::future<StorageResult<std::vector<std::byte>>> Operator::ReadAllAsync(
    std::string path, std::int64_t offset, std::optional<std::int64_t> length,
    std::stop_token cancel
)
{
    return io_manager_.Submit([this, path = std::move(path), offset, length, cancel = std::move(cancel)] {
        return ReadAll(path, offset, length, cancel);
    });
}

std::future<StorageResult<ObjectMetadata>> Operator::WriteAsync(
    std::string path, std::vector<std::byte> data, std::stop_token cancel
)
{
    return io_manager_.Submit([this, path = std::move(path), data = std::move(data),
                               cancel = std::move(cancel)] {
        return Write(path, std::span<const std::byte>(data), cancel);
    });
}

std::future<StorageResult<ObjectMetadata>> Operator::StatAsync(std::string path, std::stop_token cancel)
{
    return io_manager_.Submit([this, path = std::move(path), cancel = std::move(cancel)] {
        return Stat(path, cancel);
    });
}

std::future<StorageResult<void>> Operator::DeleteAsync(std::string path, std::stop_token cancel)
{
    return io_manager_.Submit([this, path = std::move(path), cancel = std::move(cancel)] {
        return Delete(path, cancel);
    });
}

std::future<StorageResult<std::vector<Storage::DirEntry>>> Operator::ListAllAsync(
    std::string path, std::stop_token cancel
)
{
    return io_manager_.Submit([this, path = std::move(path), cancel = std::move(cancel)] {
        return ListAll(path, cancel);
    });
}

std::future<StorageResult<void>> Operator::CreateDirAsync(std::string path, std::stop_token cancel)
{
    return io_manager_.Submit([this, path = std::move(path), cancel = std::move(cancel)] {
        return CreateDir(path, cancel);
    });
}

}  // namespace OmniStore
