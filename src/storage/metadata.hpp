#ifndef OMNISTORE_SRC_STORAGE_METADATA_HPP_
#define OMNISTORE_SRC_STORAGE_METADATA_HPP_

#include "storage/object_id.hpp"
#include "storage/storage_error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace OmniStore::Storage
{

struct ObjectMetadata {
    std::optional<std::uint64_t> content_length;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::optional<std::string> etag;
    std::optional<std::string> content_type;
    bool is_directory = false;

    static ObjectMetadata Directory()
    {
        ObjectMetadata meta;
        meta.is_directory = true;
        return meta;
    }

    static ObjectMetadata File(std::uint64_t size)
    {
        ObjectMetadata meta;
        meta.content_length = size;
        return meta;
    }

    bool operator==(const ObjectMetadata&) const = default;
};

// One listing result. `has_more` is a hint from the lister that further
// entries follow this one.
struct DirEntry {
    ObjectId id;
    ObjectMetadata metadata;
    bool has_more = false;
};

// Byte window [offset, offset + size). A missing size reads to the end.
struct BytesRange {
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> size;

    bool IsFull() const noexcept { return offset == 0 && !size.has_value(); }

    // Window of this range shifted forward by `consumed` bytes
    BytesRange Advance(std::uint64_t consumed) const
    {
        BytesRange next{offset + consumed, size};
        if (size) {
            next.size = *size > consumed ? *size - consumed : 0;
        }
        return next;
    }

    bool operator==(const BytesRange&) const = default;
};

// Validates a user supplied (offset, size) pair. Negative values fail with
// InvalidInput tagged with `op` and `path`.
inline StorageResult<BytesRange> MakeRange(
    std::int64_t offset, std::optional<std::int64_t> size, Operation op = Operation::Read,
    const std::string& path = {}
)
{
    if (offset < 0) {
        return MakeError(
            StorageErrc::InvalidInput, op, path, "range offset is negative: " + std::to_string(offset)
        );
    }
    if (size && *size < 0) {
        return MakeError(
            StorageErrc::InvalidInput, op, path, "range size is negative: " + std::to_string(*size)
        );
    }
    BytesRange range{static_cast<std::uint64_t>(offset), std::nullopt};
    if (size) {
        range.size = static_cast<std::uint64_t>(*size);
    }
    return range;
}

}  // namespace OmniStore::Storage

#endif  // OMNISTORE_SRC_STORAGE_METADATA_HPP_
