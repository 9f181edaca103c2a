#ifndef OMNISTORE_SRC_STORAGE_OBJECT_ID_HPP_
#define OMNISTORE_SRC_STORAGE_OBJECT_ID_HPP_

#include <compare>
#include <string>
#include <string_view>
#include <utility>

namespace OmniStore::Storage
{

class PathNormalizer;

/**
 * @brief Canonical identifier of an object inside one backend namespace.
 *
 * Segments are joined by '/', there is no leading separator and a trailing
 * separator is present iff the id names a directory. The backend root is "/".
 * Instances can only be produced by the PathNormalizer (or Root()), so every
 * ObjectId seen by an accessor is already canonical.
 */
class ObjectId
{
    public:
    static constexpr std::string_view kRoot = "/";

    static ObjectId Root() { return ObjectId(std::string(kRoot)); }

    const std::string& Str() const noexcept { return path_; }
    bool IsRoot() const noexcept { return path_ == kRoot; }
    bool IsDir() const noexcept { return !path_.empty() && path_.back() == '/'; }

    // Last segment, keeping the trailing '/' of directories. Root yields "/".
    std::string_view Name() const noexcept;

    // Enclosing directory; the parent of a top-level entry is the root.
    ObjectId Parent() const;

    // Child of this directory id. `segment` must be a single canonical segment,
    // optionally ending with '/'.
    ObjectId Join(std::string_view segment) const;

    auto operator<=>(const ObjectId&) const = default;
    bool operator==(const ObjectId&) const  = default;

    private:
    friend class PathNormalizer;
    explicit ObjectId(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

}  // namespace OmniStore::Storage

#endif  // OMNISTORE_SRC_STORAGE_OBJECT_ID_HPP_
