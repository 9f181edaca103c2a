#include "layers/range_accessor.hpp"
#include "io/limited_reader.hpp"

#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace OmniStore::Layers
{

using Storage::MakeError;
using Storage::Operation;
using Storage::StorageErrc;

namespace
{
std::shared_ptr<Storage::IAccessor> RequireInner(std::shared_ptr<Storage::IAccessor> inner)
{
    if (!inner) {
        throw std::invalid_argument("RangeAccessor requires an inner accessor.");
    }
    return inner;
}
}  // anonymous namespace

RangeAccessor::RangeAccessor(std::shared_ptr<Storage::IAccessor> inner)
    : inner_(RequireInner(std::move(inner))),
      inner_range_read_(inner_->Info().capability.range_read)
{
}

Storage::AccessorInfo RangeAccessor::Info() const
{
    auto info = inner_->Info();
    if (info.capability.read) {
        info.capability.range_read = true;
    }
    return info;
}

StorageResult<std::unique_ptr<Io::IReader>> RangeAccessor::Read(const Storage::ReadArgs& args)
{
    if (!args.range || args.range->IsFull()) {
        Storage::ReadArgs full_args = args;
        full_args.range.reset();
        return inner_->Read(full_args);
    }

    const Storage::BytesRange& range = *args.range;
    if (range.size && range.offset > std::numeric_limits<std::uint64_t>::max() - *range.size) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Read, args.id.Str(), "range end overflows"
        );
    }

    if (inner_range_read_) {
        auto read_res = inner_->Read(args);
        if (!read_res) {
            return std::unexpected(read_res.error());
        }
        // The backend already starts at the offset; only the length is capped here
        return Io::LimitedReader::Create(
            std::move(*read_res), Storage::BytesRange{0, range.size}, args.id.Str()
        );
    }

    spdlog::debug(
        "RangeAccessor: emulating range [{}, +{}) of '{}' client side", range.offset,
        range.size ? std::to_string(*range.size) : std::string("end"), args.id.Str()
    );
    Storage::ReadArgs full_args = args;
    full_args.range.reset();
    auto read_res = inner_->Read(full_args);
    if (!read_res) {
        return std::unexpected(read_res.error());
    }
    return Io::LimitedReader::Create(std::move(*read_res), range, args.id.Str());
}

}  // namespace OmniStore::Layers
