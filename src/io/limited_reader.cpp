#include "io/limited_reader.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace OmniStore::Io
{

namespace
{
constexpr std::size_t kSkipChunkSize = 16 * 1024;
}  // anonymous namespace

StorageResult<std::unique_ptr<IReader>> LimitedReader::Create(
    std::unique_ptr<IReader> inner, std::int64_t offset, std::optional<std::int64_t> length,
    std::string path
)
{
    auto range_res = Storage::MakeRange(offset, length, Storage::Operation::Read, path);
    if (!range_res) {
        return std::unexpected(range_res.error());
    }
    return Create(std::move(inner), *range_res, std::move(path));
}

std::unique_ptr<IReader> LimitedReader::Create(
    std::unique_ptr<IReader> inner, const Storage::BytesRange& range, std::string path
)
{
    return std::unique_ptr<IReader>(new LimitedReader(std::move(inner), range, std::move(path)));
}

LimitedReader::LimitedReader(
    std::unique_ptr<IReader> inner, const Storage::BytesRange& range, std::string path
)
    : inner_(std::move(inner)), range_(range), path_(std::move(path))
{
    if (range_.size) {
        remaining_ = *range_.size;
    }
}

StorageResult<void> LimitedReader::SkipPrefix()
{
    if (skipped_ >= range_.offset) {
        return {};
    }
    std::vector<std::byte> scratch(std::min<std::uint64_t>(kSkipChunkSize, range_.offset - skipped_));
    while (skipped_ < range_.offset) {
        std::uint64_t want = std::min<std::uint64_t>(scratch.size(), range_.offset - skipped_);
        auto read_res = inner_->Read(std::span<std::byte>(scratch.data(), want));
        if (!read_res) {
            return std::unexpected(read_res.error());
        }
        if (*read_res == 0) {
            // Window starts past the end of the inner stream
            spdlog::trace(
                "LimitedReader: '{}' ended after {} bytes, before offset {}", path_, skipped_,
                range_.offset
            );
            inner_exhausted_ = true;
            return {};
        }
        skipped_ += *read_res;
    }
    return {};
}

StorageResult<std::size_t> LimitedReader::Read(std::span<std::byte> buffer)
{
    if (auto skip_res = SkipPrefix(); !skip_res) {
        return std::unexpected(skip_res.error());
    }
    if (inner_exhausted_ || remaining_ == 0 || buffer.empty()) {
        return 0;
    }

    std::uint64_t want = std::min<std::uint64_t>(buffer.size(), remaining_);
    auto read_res      = inner_->Read(buffer.first(static_cast<std::size_t>(want)));
    if (!read_res) {
        return std::unexpected(read_res.error());
    }
    if (*read_res == 0) {
        inner_exhausted_ = true;
        return 0;
    }
    remaining_ -= *read_res;
    return *read_res;
}

StorageResult<void> LimitedReader::Rewind()
{
    if (auto rewind_res = inner_->Rewind(); !rewind_res) {
        return rewind_res;
    }
    skipped_         = 0;
    inner_exhausted_ = false;
    remaining_       = range_.size ? *range_.size : std::numeric_limits<std::uint64_t>::max();
    return {};
}

}  // namespace OmniStore::Io
