#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <unordered_map>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace OmniStore::Config
{

std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    std::uint64_t value;
    auto conv_res = std::from_chars(num_part.data(), num_part.data() + num_part.length(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != num_part.data() + num_part.length()) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, std::uint64_t> unit_multipliers = {
        { "b",                                     1},
        {"kb",                               1024ULL},
        { "k",                               1024ULL},
        {"mb",                     1024ULL * 1024ULL},
        { "m",                     1024ULL * 1024ULL},
        {"gb",           1024ULL * 1024ULL * 1024ULL},
        { "g",           1024ULL * 1024ULL * 1024ULL},
        {"tb", 1024ULL * 1024ULL * 1024ULL * 1024ULL},
        { "t", 1024ULL * 1024ULL * 1024ULL * 1024ULL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / it->second) {
        spdlog::warn("Size string '{}' does not fit in 64 bits", size_str);
        return std::nullopt;
    }
    return value * it->second;
}

namespace
{

LoadResult ParseConfig(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    OperatorConfig config;

    //------------------------------------------------------------------------------//
    // service
    //------------------------------------------------------------------------------//

    if (!j.contains("service") || !j.at("service").is_object()) {
        spdlog::error("'service' object is missing or not an object.");
        return std::unexpected(LoadError::ValidationError);
    }
    const auto &service_json = j.at("service");
    {
        std::string type_str;
        std::string root_str;
        TRY_ASSIGN_REQUIRED(type_str, service_json, "type", std::string);
        TRY_ASSIGN(root_str, service_json, "root", std::string);
        TRY_ASSIGN(
            config.service_definition.list_page_size, service_json, "list_page_size", std::size_t
        );

        auto scheme_opt = Storage::StringToScheme(type_str);
        if (!scheme_opt || *scheme_opt == Storage::Scheme::Custom) {
            spdlog::error("Invalid 'type' value in service definition: {}", type_str);
            return std::unexpected(LoadError::ValidationError);
        }
        config.service_definition.type = *scheme_opt;
        config.service_definition.root = root_str;

        if (service_json.contains("max_write_size")) {
            if (service_json.at("max_write_size").is_string()) {
                std::string max_size_str;
                TRY_ASSIGN(max_size_str, service_json, "max_write_size", std::string);
                auto parsed_bytes = ParseSizeStringToBytes(max_size_str);
                if (!parsed_bytes.has_value()) {
                    spdlog::error("Invalid 'max_write_size' string: '{}'", max_size_str);
                    return std::unexpected(LoadError::ValidationError);
                }
                config.service_definition.max_write_size = parsed_bytes.value();
            } else if (service_json.at("max_write_size").is_number_unsigned()) {
                std::uint64_t max_b = 0;
                TRY_ASSIGN(max_b, service_json, "max_write_size", std::uint64_t);
                config.service_definition.max_write_size = max_b;
            } else {
                spdlog::error("'max_write_size' must be a string or a non-negative number.");
                return std::unexpected(LoadError::ValidationError);
            }
        }
    }

    if (!config.service_definition.IsValid()) {
        spdlog::error("Parsed service definition is invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Parsed service: type='{}', root='{}', list_page_size={}",
        Storage::SchemeToString(config.service_definition.type),
        config.service_definition.root.string(), config.service_definition.list_page_size
    );

    //------------------------------------------------------------------------------//
    // retry
    //------------------------------------------------------------------------------//

    if (j.contains("retry")) {
        const auto &rs = j.at("retry");
        if (!rs.is_object()) {
            spdlog::error("'retry' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.retry_settings.enabled, rs, "enabled", bool);
        TRY_ASSIGN(config.retry_settings.max_attempts, rs, "max_attempts", std::uint32_t);
        TRY_ASSIGN(config.retry_settings.base_delay_ms, rs, "base_delay_ms", std::uint64_t);
        TRY_ASSIGN(config.retry_settings.max_delay_ms, rs, "max_delay_ms", std::uint64_t);
        TRY_ASSIGN(config.retry_settings.jitter, rs, "jitter", bool);
    }
    if (!config.retry_settings.IsValid()) {
        spdlog::error("Retry settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Retry settings: enabled={}, max_attempts={}, base_delay_ms={}, max_delay_ms={}, jitter={}",
        config.retry_settings.enabled, config.retry_settings.max_attempts,
        config.retry_settings.base_delay_ms, config.retry_settings.max_delay_ms,
        config.retry_settings.jitter
    );

    //------------------------------------------------------------------------------//
    // credential
    //------------------------------------------------------------------------------//

    if (j.contains("credential")) {
        const auto &cs = j.at("credential");
        if (!cs.is_object()) {
            spdlog::error("'credential' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string source_str = "none";
        TRY_ASSIGN(source_str, cs, "source", std::string);
        auto source_opt = StringToCredentialSource(source_str);
        if (!source_opt) {
            spdlog::error("Invalid 'source' value in credential settings: {}", source_str);
            return std::unexpected(LoadError::ValidationError);
        }
        config.credential_settings.source = *source_opt;

        TRY_ASSIGN(config.credential_settings.access_key_id, cs, "access_key_id", std::string);
        TRY_ASSIGN(
            config.credential_settings.secret_access_key, cs, "secret_access_key", std::string
        );
        TRY_ASSIGN(config.credential_settings.session_token, cs, "session_token", std::string);
        TRY_ASSIGN(config.credential_settings.region, cs, "region", std::string);
        TRY_ASSIGN(config.credential_settings.endpoint, cs, "endpoint", std::string);
        TRY_ASSIGN(config.credential_settings.cache_ttl_secs, cs, "cache_ttl_secs", std::uint64_t);
    }
    if (!config.credential_settings.IsValid()) {
        spdlog::error("Credential settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Credential settings: source='{}', cache_ttl_secs={}",
        CredentialSourceToString(config.credential_settings.source),
        config.credential_settings.cache_ttl_secs
    );

    //------------------------------------------------------------------------------//
    // global_settings
    //------------------------------------------------------------------------------//

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str(spdlog::level::to_string_view(Constants::DEFAULT_LOG_LEVEL).data());
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }
        TRY_ASSIGN(config.global_settings.io_threads, gs, "io_threads", std::size_t);
    }
    spdlog::info(
        "Global settings: log_level='{}', io_threads={}",
        spdlog::level::to_string_view(config.global_settings.log_level),
        config.global_settings.io_threads
    );

    if (!config.IsValid()) {
        spdlog::error("Overall operator configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }
    return config;
}

}  // anonymous namespace

LoadResult LoadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    auto config = ParseConfig(j);
    if (config) {
        spdlog::info("Configuration loaded successfully from: {}", file_path.string());
    }
    return config;
}

LoadResult LoadConfigFromString(const std::string &json_text)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    return ParseConfig(j);
}

LoadErrorMsg LoadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = LoadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    }

    std::string error_message = "Failed to load config (" + file_path.string() + "): ";
    switch (result.error()) {
        case LoadError::FileNotFound:
            error_message += "File not found.";
            break;
        case LoadError::JsonParseError:
            error_message += "JSON parsing failed.";
            break;
        case LoadError::ValidationError:
            error_message += "Configuration validation failed.";
            break;
        default:
            error_message += "Unknown error.";
            break;
    }
    return std::unexpected(error_message);
}

}  // namespace OmniStore::Config
