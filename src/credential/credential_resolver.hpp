#ifndef OMNISTORE_SRC_CREDENTIAL_CREDENTIAL_RESOLVER_HPP_
#define OMNISTORE_SRC_CREDENTIAL_CREDENTIAL_RESOLVER_HPP_

#include "storage/storage_error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace OmniStore::Credential
{

using Storage::StorageResult;

constexpr std::chrono::seconds kDefaultCredentialTtl{900};

struct Credential {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string region;
    std::string endpoint;
    std::optional<std::chrono::system_clock::time_point> expires_at;

    bool operator==(const Credential&) const = default;
};

// Supplies the active credentials and resolved endpoint/region of a backend.
// Failures are reported as PermissionDenied (bad or missing credentials) or
// Unavailable (the source could not be reached).
class ICredentialResolver
{
    public:
    virtual ~ICredentialResolver() = default;

    virtual StorageResult<Credential> Resolve(std::stop_token cancel) = 0;
};

// Folds any resolver failure into the two kinds callers may observe
Storage::StorageError ClassifyResolutionFailure(const Storage::StorageError& error);

//------------------------------------------------------------------------------//
// Resolver Implementations
//------------------------------------------------------------------------------//

class StaticCredentialResolver : public ICredentialResolver
{
    public:
    explicit StaticCredentialResolver(Credential credential) : credential_(std::move(credential)) {}

    StorageResult<Credential> Resolve(std::stop_token cancel) override;

    private:
    const Credential credential_;
};

// Reads OMNISTORE_ACCESS_KEY_ID, OMNISTORE_SECRET_ACCESS_KEY,
// OMNISTORE_SESSION_TOKEN, OMNISTORE_REGION and OMNISTORE_ENDPOINT.
class EnvCredentialResolver : public ICredentialResolver
{
    public:
    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    EnvCredentialResolver();
    explicit EnvCredentialResolver(EnvLookup lookup) : lookup_(std::move(lookup)) {}

    StorageResult<Credential> Resolve(std::stop_token cancel) override;

    private:
    EnvLookup lookup_;
};

/**
 * @brief Memoizes another resolver for a fixed time to live.
 *
 * The inner resolver is called on the first Resolve() and again once the
 * cached entry is older than `ttl` or past the credential's own expiry,
 * whichever comes first. Failures are never cached. Concurrent callers are
 * serialized so only one of them refreshes.
 */
class CachingCredentialResolver : public ICredentialResolver
{
    public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CachingCredentialResolver(
        std::shared_ptr<ICredentialResolver> inner, std::chrono::seconds ttl = kDefaultCredentialTtl,
        Clock clock = [] {
            return std::chrono::system_clock::now();
        }
    );

    StorageResult<Credential> Resolve(std::stop_token cancel) override;

    // Drops the cached entry so the next Resolve() refreshes
    void Invalidate();

    std::uint64_t RefreshCount() const;

    private:
    std::shared_ptr<ICredentialResolver> inner_;
    const std::chrono::seconds ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::optional<Credential> cached_;
    std::chrono::system_clock::time_point valid_until_{};
    std::uint64_t refresh_count_ = 0;
};

}  // namespace OmniStore::Credential

#endif  // OMNISTORE_SRC_CREDENTIAL_CREDENTIAL_RESOLVER_HPP_
