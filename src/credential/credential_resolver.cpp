#include "credential/credential_resolver.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace OmniStore::Credential
{

using Storage::MakeError;
using Storage::Operation;
using Storage::StorageErrc;

Storage::StorageError ClassifyResolutionFailure(const Storage::StorageError& error)
{
    if (Storage::IsCancelled(error)) {
        return error;
    }
    switch (error.Kind()) {
        case StorageErrc::PermissionDenied:
        case StorageErrc::Unavailable:
            return error;
        case StorageErrc::RateLimited:
            return error.WithKind(StorageErrc::Unavailable, "credential source throttled");
        default:
            return error.WithKind(StorageErrc::PermissionDenied, "credential resolution failed");
    }
}

//------------------------------------------------------------------------------//
// StaticCredentialResolver
//------------------------------------------------------------------------------//

StorageResult<Credential> StaticCredentialResolver::Resolve(std::stop_token cancel)
{
    (void)cancel;
    if (credential_.access_key_id.empty() || credential_.secret_access_key.empty()) {
        return MakeError(
            StorageErrc::PermissionDenied, Operation::Stat, {}, "static credential is incomplete"
        );
    }
    return credential_;
}

//------------------------------------------------------------------------------//
// EnvCredentialResolver
//------------------------------------------------------------------------------//

EnvCredentialResolver::EnvCredentialResolver()
    : lookup_([](const char* name) -> std::optional<std::string> {
          const char* value = std::getenv(name);
          if (value == nullptr) {
              return std::nullopt;
          }
          return std::string(value);
      })
{
}

StorageResult<Credential> EnvCredentialResolver::Resolve(std::stop_token cancel)
{
    if (cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::Stat, {});
    }

    Credential credential;
    auto key_id = lookup_("OMNISTORE_ACCESS_KEY_ID");
    auto secret = lookup_("OMNISTORE_SECRET_ACCESS_KEY");
    if (!key_id || key_id->empty() || !secret || secret->empty()) {
        spdlog::debug("EnvCredentialResolver: access key id or secret missing from environment");
        return MakeError(
            StorageErrc::PermissionDenied, Operation::Stat, {},
            "OMNISTORE_ACCESS_KEY_ID / OMNISTORE_SECRET_ACCESS_KEY not set"
        );
    }
    credential.access_key_id     = std::move(*key_id);
    credential.secret_access_key = std::move(*secret);
    credential.session_token     = lookup_("OMNISTORE_SESSION_TOKEN").value_or("");
    credential.region            = lookup_("OMNISTORE_REGION").value_or("");
    credential.endpoint          = lookup_("OMNISTORE_ENDPOINT").value_or("");
    return credential;
}

//------------------------------------------------------------------------------//
// CachingCredentialResolver
//------------------------------------------------------------------------------//

CachingCredentialResolver::CachingCredentialResolver(
    std::shared_ptr<ICredentialResolver> inner, std::chrono::seconds ttl, Clock clock
)
    : inner_(std::move(inner)), ttl_(ttl), clock_(std::move(clock))
{
    if (!inner_) {
        throw std::invalid_argument("CachingCredentialResolver requires an inner resolver.");
    }
}

StorageResult<Credential> CachingCredentialResolver::Resolve(std::stop_token cancel)
{
    std::lock_guard lock(mutex_);

    auto now = clock_();
    if (cached_ && now < valid_until_) {
        return *cached_;
    }

    auto resolve_res = inner_->Resolve(cancel);
    if (!resolve_res) {
        spdlog::warn(
            "CachingCredentialResolver: refresh failed: {}", resolve_res.error().ToString()
        );
        return std::unexpected(resolve_res.error());
    }

    valid_until_ = now + ttl_;
    if (resolve_res->expires_at) {
        valid_until_ = std::min(valid_until_, *resolve_res->expires_at);
    }
    cached_ = std::move(*resolve_res);
    ++refresh_count_;
    spdlog::debug("CachingCredentialResolver: credential refreshed (refresh #{})", refresh_count_);
    return *cached_;
}

void CachingCredentialResolver::Invalidate()
{
    std::lock_guard lock(mutex_);
    cached_.reset();
}

std::uint64_t CachingCredentialResolver::RefreshCount() const
{
    std::lock_guard lock(mutex_);
    return refresh_count_;
}

}  // namespace OmniStore::Credential
