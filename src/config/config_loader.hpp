#ifndef OMNISTORE_SRC_CONFIG_CONFIG_LOADER_HPP_
#define OMNISTORE_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace OmniStore::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<OperatorConfig, LoadError>;
using LoadErrorMsg = std::expected<OperatorConfig, std::string>;

LoadResult LoadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg LoadConfigFromFileVerbose(const std::filesystem::path &file_path);

// Same parsing on an in-memory document
LoadResult LoadConfigFromString(const std::string &json_text);

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
// Returns std::nullopt if parsing fails.
std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str);

}  // namespace OmniStore::Config

#endif  // OMNISTORE_SRC_CONFIG_CONFIG_LOADER_HPP_
