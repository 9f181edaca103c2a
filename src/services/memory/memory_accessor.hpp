#ifndef OMNISTORE_SRC_SERVICES_MEMORY_MEMORY_ACCESSOR_HPP_
#define OMNISTORE_SRC_SERVICES_MEMORY_MEMORY_ACCESSOR_HPP_

#include "config/config_types.hpp"
#include "storage/i_accessor.hpp"

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace OmniStore::Services
{

namespace bmi = boost::multi_index;

/**
 * @brief Process-local object store.
 *
 * Keys are canonical ObjectId strings. Files map to their bytes; directories
 * exist either as explicit markers (keys ending in '/') created by CreateDir,
 * or implicitly as the prefix of a stored key. Writes overwrite and become
 * visible when the writer commits, so a failed write leaves the previous
 * object intact.
 */
class MemoryAccessor : public Storage::IAccessor
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//

    struct MemoryObject {
        std::string key;
        std::shared_ptr<const std::vector<std::byte>> data;  ///< Null for directory markers
        Storage::ObjectMetadata metadata;
    };

    struct by_key {
    };
    struct by_order {
    };
    using ObjectContainer = bmi::multi_index_container<
        MemoryObject,
        bmi::indexed_by<
            bmi::hashed_unique<
                bmi::tag<by_key>, bmi::member<MemoryObject, std::string, &MemoryObject::key>>,
            bmi::ordered_unique<
                bmi::tag<by_order>, bmi::member<MemoryObject, std::string, &MemoryObject::key>>>>;

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit MemoryAccessor(const Config::ServiceDefinition& definition);
    ~MemoryAccessor() override = default;

    MemoryAccessor(const MemoryAccessor&)            = delete;
    MemoryAccessor& operator=(const MemoryAccessor&) = delete;
    MemoryAccessor(MemoryAccessor&&)                 = delete;
    MemoryAccessor& operator=(MemoryAccessor&&)      = delete;

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

    std::size_t ObjectCount() const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//

    Storage::StorageResult<Storage::ObjectMetadata> Commit(
        const Storage::WriteArgs& args, std::vector<std::byte> data
    );
    Storage::StorageResult<Io::ListPage> FetchPage(
        const Storage::ObjectId& dir, const std::optional<std::string>& token
    ) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//

    const Config::ServiceDefinition definition_;
    Storage::AccessorInfo info_;

    ObjectContainer objects_;
    mutable std::shared_mutex objects_mutex_;
};

}  // namespace OmniStore::Services

#endif  // OMNISTORE_SRC_SERVICES_MEMORY_MEMORY_ACCESSOR_HPP_
