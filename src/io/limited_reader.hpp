#ifndef OMNISTORE_SRC_IO_LIMITED_READER_HPP_
#define OMNISTORE_SRC_IO_LIMITED_READER_HPP_

#include "io/reader.hpp"
#include "storage/metadata.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>

namespace OmniStore::Io
{

/**
 * @brief Exposes the window [offset, offset + length) of another reader.
 *
 * The first `offset` bytes of the inner stream are skipped lazily on the first
 * Read(); afterwards at most `length` bytes are produced and end of stream is
 * reported even if the inner stream holds more. The inner reader is never
 * asked for a byte beyond the window.
 */
class LimitedReader : public IReader
{
    public:
    // Fails with InvalidInput when offset or length is negative
    static StorageResult<std::unique_ptr<IReader>> Create(
        std::unique_ptr<IReader> inner, std::int64_t offset, std::optional<std::int64_t> length,
        std::string path = {}
    );

    static std::unique_ptr<IReader> Create(
        std::unique_ptr<IReader> inner, const Storage::BytesRange& range, std::string path = {}
    );

    LimitedReader(const LimitedReader&)            = delete;
    LimitedReader& operator=(const LimitedReader&) = delete;

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override;
    bool IsSeekable() const override { return inner_->IsSeekable(); }
    StorageResult<void> Rewind() override;

    private:
    LimitedReader(std::unique_ptr<IReader> inner, const Storage::BytesRange& range, std::string path);

    StorageResult<void> SkipPrefix();

    std::unique_ptr<IReader> inner_;
    Storage::BytesRange range_;
    std::string path_;

    std::uint64_t skipped_   = 0;
    std::uint64_t remaining_ = std::numeric_limits<std::uint64_t>::max();
    bool inner_exhausted_    = false;
};

}  // namespace OmniStore::Io

#endif  // OMNISTORE_SRC_IO_LIMITED_READER_HPP_
