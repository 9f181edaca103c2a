#ifndef OMNISTORE_SRC_STORAGE_I_ACCESSOR_HPP_
#define OMNISTORE_SRC_STORAGE_I_ACCESSOR_HPP_

#include "io/lister.hpp"
#include "io/reader.hpp"
#include "storage/capability.hpp"
#include "storage/metadata.hpp"
#include "storage/object_id.hpp"
#include "storage/storage_error.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>

namespace OmniStore::Credential
{
struct Credential;
}  // namespace OmniStore::Credential

namespace OmniStore::Storage
{

//------------------------------------------------------------------------------//
// Operation Arguments
//------------------------------------------------------------------------------//

struct ReadArgs {
    ObjectId id;
    std::optional<BytesRange> range;
    std::stop_token cancel;
};

struct WriteArgs {
    ObjectId id;
    std::optional<std::uint64_t> size_hint;
    std::stop_token cancel;
};

struct StatArgs {
    ObjectId id;
    std::stop_token cancel;
};

struct DeleteArgs {
    ObjectId id;
    std::stop_token cancel;
};

struct ListArgs {
    ObjectId id;
    std::stop_token cancel;
};

struct CreateDirArgs {
    ObjectId id;
    std::stop_token cancel;
};

/**
 * @brief Contract every backend driver and every layer implements.
 *
 * Accessors only ever see canonical ObjectIds. Native backend errors are
 * classified into StorageErrc before they leave an accessor. An operation
 * missing from Info().capability must fail with Unsupported without touching
 * the backend.
 *
 *  - Read: NotFound when absent, Unsupported for a range without range_read,
 *    InvalidInput for a malformed range.
 *  - Write: consumes `reader` completely; overwrite semantics are documented
 *    per backend.
 *  - Delete: idempotent, deleting an absent object succeeds.
 *  - Stat: NotFound when absent.
 *  - List: `id` is a directory; NotFound only if the backend can tell a
 *    missing prefix apart, otherwise an empty lister.
 *  - CreateDir: idempotent.
 *
 * Readers and listers may call back into the accessor that produced them; the
 * caller keeps that accessor alive until they are dropped.
 */
class IAccessor
{
    public:
    virtual ~IAccessor() = default;

    [[nodiscard]] virtual AccessorInfo Info() const = 0;

    virtual StorageResult<std::unique_ptr<Io::IReader>> Read(const ReadArgs& args)         = 0;
    virtual StorageResult<ObjectMetadata> Write(const WriteArgs& args, Io::IReader& reader) = 0;
    virtual StorageResult<void> Delete(const DeleteArgs& args)                              = 0;
    virtual StorageResult<ObjectMetadata> Stat(const StatArgs& args)                        = 0;
    virtual StorageResult<std::unique_ptr<Io::ILister>> List(const ListArgs& args)         = 0;
    virtual StorageResult<void> CreateDir(const CreateDirArgs& args)                        = 0;

    // Hands freshly resolved credentials to backends whose capability sets
    // needs_credential. Layers forward it; other backends ignore it.
    virtual StorageResult<void> Authorize(const Credential::Credential& credential)
    {
        (void)credential;
        return {};
    }
};

// Fail-fast helper for accessors that check their own capability
inline StorageResult<void> CheckCapability(
    const Capability& capability, Operation op, const ObjectId& id
)
{
    if (!capability.Supports(op)) {
        return MakeError(
            StorageErrc::Unsupported, op, id.Str(),
            std::string(OperationToString(op)) + " is not in the accessor capability set"
        );
    }
    return {};
}

}  // namespace OmniStore::Storage

#endif  // OMNISTORE_SRC_STORAGE_I_ACCESSOR_HPP_
