#ifndef OMNISTORE_SRC_LAYERS_RANGE_ACCESSOR_HPP_
#define OMNISTORE_SRC_LAYERS_RANGE_ACCESSOR_HPP_

#include "storage/i_accessor.hpp"

#include <memory>

namespace OmniStore::Layers
{

using Storage::StorageResult;

/**
 * @brief Gives every backend ranged reads.
 *
 * A requested range is pushed down to the inner accessor when it supports
 * range_read, and emulated by skipping client side otherwise. Either way the
 * returned stream is capped with a LimitedReader so no byte past the window
 * ever reaches the caller. The layer therefore advertises range_read for any
 * readable backend.
 */
class RangeAccessor : public Storage::IAccessor
{
    public:
    explicit RangeAccessor(std::shared_ptr<Storage::IAccessor> inner);

    RangeAccessor(const RangeAccessor&)            = delete;
    RangeAccessor& operator=(const RangeAccessor&) = delete;

    [[nodiscard]] Storage::AccessorInfo Info() const override;

    StorageResult<std::unique_ptr<Io::IReader>> Read(const Storage::ReadArgs& args) override;

    StorageResult<Storage::ObjectMetadata> Write(
        const Storage::WriteArgs& args, Io::IReader& reader
    ) override
    {
        return inner_->Write(args, reader);
    }
    StorageResult<void> Delete(const Storage::DeleteArgs& args) override { return inner_->Delete(args); }
    StorageResult<Storage::ObjectMetadata> Stat(const Storage::StatArgs& args) override
    {
        return inner_->Stat(args);
    }
    StorageResult<std::unique_ptr<Io::ILister>> List(const Storage::ListArgs& args) override
    {
        return inner_->List(args);
    }
    StorageResult<void> CreateDir(const Storage::CreateDirArgs& args) override
    {
        return inner_->CreateDir(args);
    }
    StorageResult<void> Authorize(const Credential::Credential& credential) override
    {
        return inner_->Authorize(credential);
    }

    private:
    std::shared_ptr<Storage::IAccessor> inner_;
    const bool inner_range_read_;
};

}  // namespace OmniStore::Layers

#endif  // OMNISTORE_SRC_LAYERS_RANGE_ACCESSOR_HPP_
