#ifndef OMNISTORE_SRC_STORAGE_CAPABILITY_HPP_
#define OMNISTORE_SRC_STORAGE_CAPABILITY_HPP_

#include "storage/storage_error.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace OmniStore::Storage
{

//------------------------------------------------------------------------------//
// Enumerations for Accessor Types
//------------------------------------------------------------------------------//

enum class Scheme : std::uint8_t { Memory, Fs, Custom };

std::optional<Scheme> StringToScheme(const std::string& scheme_str);
const char* SchemeToString(Scheme scheme);

//------------------------------------------------------------------------------//
// Structs for Accessor Description
//------------------------------------------------------------------------------//

// Immutable once the accessor is constructed; shared read-only by all layers.
struct Capability {
    bool read       = false;
    bool write      = false;
    bool delete_    = false;
    bool list       = false;
    bool stat       = false;
    bool create_dir = false;
    bool range_read = false;

    std::optional<std::uint64_t> max_write_size;  ///< Largest single write request
    bool needs_credential = false;                ///< Backend consumes resolved credentials

    bool Supports(Operation op) const noexcept
    {
        switch (op) {
            case Operation::Read:
                return read;
            case Operation::Write:
                return write;
            case Operation::Delete:
                return delete_;
            case Operation::Stat:
                return stat;
            case Operation::List:
                return list;
            case Operation::CreateDir:
                return create_dir;
            default:
                return false;
        }
    }

    static Capability All()
    {
        return Capability{
            .read       = true,
            .write      = true,
            .delete_    = true,
            .list       = true,
            .stat       = true,
            .create_dir = true,
            .range_read = true,
        };
    }
};

struct AccessorInfo {
    Scheme scheme = Scheme::Custom;
    std::string root;
    std::string name;
    Capability capability;
};

//------------------------------------------------------------------------------//
// Implementation of Enum Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<Scheme> StringToScheme(const std::string& scheme_str)
{
    if (scheme_str == "memory") {
        return Scheme::Memory;
    }
    if (scheme_str == "fs") {
        return Scheme::Fs;
    }
    if (scheme_str == "custom") {
        return Scheme::Custom;
    }
    return std::nullopt;
}

inline const char* SchemeToString(Scheme scheme)
{
    switch (scheme) {
        case Scheme::Memory:
            return "memory";
        case Scheme::Fs:
            return "fs";
        case Scheme::Custom:
            return "custom";
        default:
            return "unknown";
    }
}

}  // namespace OmniStore::Storage

#endif  // OMNISTORE_SRC_STORAGE_CAPABILITY_HPP_
