#ifndef OMNISTORE_SRC_APP_CONSTANTS_HPP_
#define OMNISTORE_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#ifndef OMNISTORE_VERSION
#define OMNISTORE_VERSION "0.0.0"
#endif

namespace OmniStore::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "omnistore";
constexpr std::string_view APP_VERSION_STRING = "OmniStore version " OMNISTORE_VERSION;

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Retry
constexpr std::uint32_t DEFAULT_RETRY_MAX_ATTEMPTS           = 4;
constexpr std::chrono::milliseconds DEFAULT_RETRY_BASE_DELAY = std::chrono::milliseconds(100);
constexpr std::chrono::milliseconds DEFAULT_RETRY_MAX_DELAY  = std::chrono::milliseconds(5000);

// Listing & I/O
constexpr std::size_t DEFAULT_LIST_PAGE_SIZE = 1000;
constexpr std::size_t DEFAULT_IO_THREADS     = 4;

}  // namespace OmniStore::Constants

#endif  // OMNISTORE_SRC_APP_CONSTANTS_HPP_
