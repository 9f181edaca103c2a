#ifndef OMNISTORE_SRC_CONFIG_CONFIG_TYPES_HPP_
#define OMNISTORE_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"
#include "storage/capability.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace OmniStore::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

enum class CredentialSource : std::uint8_t { None, Static, Env };

std::optional<CredentialSource> StringToCredentialSource(const std::string &source_str);
const char *CredentialSourceToString(CredentialSource source);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::size_t io_threads              = Constants::DEFAULT_IO_THREADS;
};

struct ServiceDefinition {
    Storage::Scheme type = Storage::Scheme::Memory;
    std::filesystem::path root;  ///< Required for fs, a label for memory
    std::size_t list_page_size = Constants::DEFAULT_LIST_PAGE_SIZE;

    std::optional<std::uint64_t> max_write_size;

    bool IsValid() const;
};

struct RetrySettings {
    bool enabled               = true;
    std::uint32_t max_attempts = Constants::DEFAULT_RETRY_MAX_ATTEMPTS;
    std::uint64_t base_delay_ms =
        static_cast<std::uint64_t>(Constants::DEFAULT_RETRY_BASE_DELAY.count());
    std::uint64_t max_delay_ms =
        static_cast<std::uint64_t>(Constants::DEFAULT_RETRY_MAX_DELAY.count());
    bool jitter = true;

    bool IsValid() const;
};

struct CredentialSettings {
    CredentialSource source = CredentialSource::None;

    // Only read for the static source
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string region;
    std::string endpoint;

    std::uint64_t cache_ttl_secs = 900;

    bool IsValid() const;
};

struct OperatorConfig {
    ServiceDefinition service_definition;
    RetrySettings retry_settings;
    CredentialSettings credential_settings;
    GlobalSettings global_settings;

    bool IsValid() const
    {
        return service_definition.IsValid() && retry_settings.IsValid() &&
               credential_settings.IsValid() && global_settings.io_threads > 0;
    }
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<CredentialSource> StringToCredentialSource(const std::string &source_str)
{
    if (source_str == "none") {
        return CredentialSource::None;
    }
    if (source_str == "static") {
        return CredentialSource::Static;
    }
    if (source_str == "env") {
        return CredentialSource::Env;
    }
    return std::nullopt;
}

inline const char *CredentialSourceToString(CredentialSource source)
{
    switch (source) {
        case CredentialSource::None:
            return "None";
        case CredentialSource::Static:
            return "Static";
        case CredentialSource::Env:
            return "Env";
        default:
            return "Unknown";
    }
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool ServiceDefinition::IsValid() const
{
    if (list_page_size == 0) {
        return false;
    }
    if (type == Storage::Scheme::Fs && root.empty()) {
        return false;
    }
    if (type == Storage::Scheme::Custom) {
        spdlog::error("Service type 'custom' cannot be built from configuration.");
        return false;
    }
    if (max_write_size.has_value() && *max_write_size == 0) {
        return false;
    }
    return true;
}

inline bool RetrySettings::IsValid() const
{
    if (max_attempts == 0) {
        return false;
    }
    if (base_delay_ms > max_delay_ms) {
        spdlog::error(
            "base_delay_ms ({}) cannot exceed max_delay_ms ({}).", base_delay_ms, max_delay_ms
        );
        return false;
    }
    return true;
}

inline bool CredentialSettings::IsValid() const
{
    if (source == CredentialSource::Static &&
        (access_key_id.empty() || secret_access_key.empty())) {
        return false;
    }
    if (source != CredentialSource::Static && !access_key_id.empty()) {
        spdlog::warn("access_key_id specified for a non-static credential source.");
    }
    return cache_ttl_secs > 0;
}

}  // namespace OmniStore::Config

#endif  // OMNISTORE_SRC_CONFIG_CONFIG_TYPES_HPP_
