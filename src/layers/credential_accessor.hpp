#ifndef OMNISTORE_SRC_LAYERS_CREDENTIAL_ACCESSOR_HPP_
#define OMNISTORE_SRC_LAYERS_CREDENTIAL_ACCESSOR_HPP_

#include "credential/credential_resolver.hpp"
#include "storage/i_accessor.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace OmniStore::Layers
{

using Storage::StorageResult;

/**
 * @brief Authorizes a credentialed backend before each request.
 *
 * Nothing is resolved at construction. Before every operation the resolver is
 * asked for the current credential (a CachingCredentialResolver makes this
 * cheap); whenever it differs from the one last handed over, the backend is
 * re-authorized. Resolution failures surface as PermissionDenied or
 * Unavailable and the backend is never called.
 */
class CredentialAccessor : public Storage::IAccessor
{
    public:
    CredentialAccessor(
        std::shared_ptr<Storage::IAccessor> inner,
        std::shared_ptr<Credential::ICredentialResolver> resolver
    );

    CredentialAccessor(const CredentialAccessor&)            = delete;
    CredentialAccessor& operator=(const CredentialAccessor&) = delete;

    [[nodiscard]] Storage::AccessorInfo Info() const override { return inner_->Info(); }

    StorageResult<std::unique_ptr<Io::IReader>> Read(const Storage::ReadArgs& args) override;
    StorageResult<Storage::ObjectMetadata> Write(
        const Storage::WriteArgs& args, Io::IReader& reader
    ) override;
    StorageResult<void> Delete(const Storage::DeleteArgs& args) override;
    StorageResult<Storage::ObjectMetadata> Stat(const Storage::StatArgs& args) override;
    StorageResult<std::unique_ptr<Io::ILister>> List(const Storage::ListArgs& args) override;
    StorageResult<void> CreateDir(const Storage::CreateDirArgs& args) override;

    StorageResult<void> Authorize(const Credential::Credential& credential) override;

    private:
    StorageResult<void> EnsureAuthorized(
        Storage::Operation op, const Storage::ObjectId& id, const std::stop_token& cancel
    );

    std::shared_ptr<Storage::IAccessor> inner_;
    std::shared_ptr<Credential::ICredentialResolver> resolver_;

    std::mutex mutex_;
    std::optional<Credential::Credential> active_;
};

}  // namespace OmniStore::Layers

#endif  // OMNISTORE_SRC_LAYERS_CREDENTIAL_ACCESSOR_HPP_
