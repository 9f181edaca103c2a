#ifndef OMNISTORE_SRC_SERVICES_FS_FS_ACCESSOR_HPP_
#define OMNISTORE_SRC_SERVICES_FS_FS_ACCESSOR_HPP_

#include "config/config_types.hpp"
#include "storage/i_accessor.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace OmniStore::Services
{

/**
 * @brief Accessor over a directory of the local filesystem.
 *
 * Object ids are resolved below the configured root. Reads are chunked
 * pread() calls and support ranges natively. Writes go to a hidden temporary
 * file in the target directory that is renamed over the target on commit, so
 * readers observe either the old or the new content. Missing parent
 * directories are created on write.
 */
class FsAccessor : public Storage::IAccessor
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit FsAccessor(const Config::ServiceDefinition& definition);
    ~FsAccessor() override = default;

    FsAccessor(const FsAccessor&)            = delete;
    FsAccessor& operator=(const FsAccessor&) = delete;
    FsAccessor(FsAccessor&&)                 = delete;
    FsAccessor& operator=(FsAccessor&&)      = delete;

    // Creates the root directory if needed and checks that it is one
    Storage::StorageResult<void> Initialize();

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    [[nodiscard]] Storage::AccessorInfo Info() const override { return info_; }

    Storage::StorageResult<std::unique_ptr<Io::IReader>> Read(const Storage::ReadArgs& args) override;
    Storage::StorageResult<Storage::ObjectMetadata> Write(
        const Storage::WriteArgs& args, Io::IReader& reader
    ) override;
    Storage::StorageResult<void> Delete(const Storage::DeleteArgs& args) override;
    Storage::StorageResult<Storage::ObjectMetadata> Stat(const Storage::StatArgs& args) override;
    Storage::StorageResult<std::unique_ptr<Io::ILister>> List(const Storage::ListArgs& args) override;
    Storage::StorageResult<void> CreateDir(const Storage::CreateDirArgs& args) override;

    // Empty when the id would resolve outside the root
    std::filesystem::path GetFullPath(const Storage::ObjectId& id) const;

    static constexpr std::string_view kTempPrefix = ".omnistore-tmp-";

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    Storage::StorageResult<std::filesystem::path> ResolvePath(
        const Storage::ObjectId& id, Storage::Operation op
    ) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//

    const Config::ServiceDefinition definition_;
    std::filesystem::path base_path_;
    Storage::AccessorInfo info_;
};

// Classifies a std::filesystem / errno failure and logs it the way every
// fs backend call does. `step` names the failing system call for the log.
Storage::StorageError MapFilesystemError(
    const std::error_code& ec, Storage::Operation op, const Storage::ObjectId& id,
    const std::string& step = ""
);

}  // namespace OmniStore::Services

#endif  // OMNISTORE_SRC_SERVICES_FS_FS_ACCESSOR_HPP_
