#ifndef OMNISTORE_SRC_STORAGE_PATH_NORMALIZER_HPP_
#define OMNISTORE_SRC_STORAGE_PATH_NORMALIZER_HPP_

#include "storage/object_id.hpp"
#include "storage/storage_error.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace OmniStore::Storage
{

class PathNormalizer
{
    public:
    PathNormalizer()                                 = delete;
    PathNormalizer(const PathNormalizer&)            = delete;
    PathNormalizer& operator=(const PathNormalizer&) = delete;

    // Canonicalizes a user path:
    //  - '\\' is rewritten to '/', repeated separators collapse
    //  - "." segments vanish, ".." pops the previous segment
    //  - ".." above the root fails with InvalidPath, as do NUL bytes
    //  - a trailing separator (or a trailing "." / "..") marks a directory
    //  - an empty path is the root
    // `op` only tags the error.
    static StorageResult<ObjectId> Normalize(std::string_view raw, Operation op = Operation::Stat);

    private:
    static ObjectId FromCanonical(std::string canonical) { return ObjectId(std::move(canonical)); }
};

}  // namespace OmniStore::Storage

#endif  // OMNISTORE_SRC_STORAGE_PATH_NORMALIZER_HPP_
