#include "layers/credential_accessor.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace OmniStore::Layers
{

using Storage::Operation;
using Storage::StorageError;

CredentialAccessor::CredentialAccessor(
    std::shared_ptr<Storage::IAccessor> inner,
    std::shared_ptr<Credential::ICredentialResolver> resolver
)
    : inner_(std::move(inner)), resolver_(std::move(resolver))
{
    if (!inner_ || !resolver_) {
        throw std::invalid_argument("CredentialAccessor requires an inner accessor and a resolver.");
    }
}

StorageResult<void> CredentialAccessor::EnsureAuthorized(
    Operation op, const Storage::ObjectId& id, const std::stop_token& cancel
)
{
    if (cancel.stop_requested()) {
        return Storage::MakeCancelledError(op, id.Str());
    }

    // Resolution happens under the lock so concurrent first requests share it
    std::lock_guard lock(mutex_);

    auto resolve_res = resolver_->Resolve(cancel);
    if (!resolve_res) {
        if (Storage::IsCancelled(resolve_res.error())) {
            return Storage::MakeCancelledError(op, id.Str());
        }
        auto classified = Credential::ClassifyResolutionFailure(resolve_res.error());
        spdlog::error(
            "CredentialAccessor: cannot resolve credentials for {} '{}': {}",
            Storage::OperationToString(op), id.Str(), classified.ToString()
        );
        return std::unexpected(StorageError(classified.Kind(), op, id.Str(), classified.Detail()));
    }

    if (active_ && *active_ == *resolve_res) {
        return {};
    }

    if (auto auth_res = inner_->Authorize(*resolve_res); !auth_res) {
        if (Storage::IsCancelled(auth_res.error())) {
            return Storage::MakeCancelledError(op, id.Str());
        }
        auto classified = Credential::ClassifyResolutionFailure(auth_res.error());
        return std::unexpected(StorageError(classified.Kind(), op, id.Str(), classified.Detail()));
    }
    spdlog::debug(
        "CredentialAccessor: backend '{}' authorized (region '{}')", inner_->Info().name,
        resolve_res->region
    );
    active_ = std::move(*resolve_res);
    return {};
}

StorageResult<void> CredentialAccessor::Authorize(const Credential::Credential& credential)
{
    std::lock_guard lock(mutex_);
    auto auth_res = inner_->Authorize(credential);
    if (auth_res) {
        active_ = credential;
    }
    return auth_res;
}

StorageResult<std::unique_ptr<Io::IReader>> CredentialAccessor::Read(const Storage::ReadArgs& args)
{
    if (auto auth = EnsureAuthorized(Operation::Read, args.id, args.cancel); !auth) {
        return std::unexpected(auth.error());
    }
    return inner_->Read(args);
}

StorageResult<Storage::ObjectMetadata> CredentialAccessor::Write(
    const Storage::WriteArgs& args, Io::IReader& reader
)
{
    if (auto auth = EnsureAuthorized(Operation::Write, args.id, args.cancel); !auth) {
        return std::unexpected(auth.error());
    }
    return inner_->Write(args, reader);
}

StorageResult<void> CredentialAccessor::Delete(const Storage::DeleteArgs& args)
{
    if (auto auth = EnsureAuthorized(Operation::Delete, args.id, args.cancel); !auth) {
        return auth;
    }
    return inner_->Delete(args);
}

StorageResult<Storage::ObjectMetadata> CredentialAccessor::Stat(const Storage::StatArgs& args)
{
    if (auto auth = EnsureAuthorized(Operation::Stat, args.id, args.cancel); !auth) {
        return std::unexpected(auth.error());
    }
    return inner_->Stat(args);
}

StorageResult<std::unique_ptr<Io::ILister>> CredentialAccessor::List(const Storage::ListArgs& args)
{
    if (auto auth = EnsureAuthorized(Operation::List, args.id, args.cancel); !auth) {
        return std::unexpected(auth.error());
    }
    return inner_->List(args);
}

StorageResult<void> CredentialAccessor::CreateDir(const Storage::CreateDirArgs& args)
{
    if (auto auth = EnsureAuthorized(Operation::CreateDir, args.id, args.cancel); !auth) {
        return auth;
    }
    return inner_->CreateDir(args);
}

}  // namespace OmniStore::Layers
