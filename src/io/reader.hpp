#ifndef OMNISTORE_SRC_IO_READER_HPP_
#define OMNISTORE_SRC_IO_READER_HPP_

#include "storage/storage_error.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace OmniStore::Io
{

using Storage::StorageResult;

constexpr std::size_t kDefaultChunkSize = 64 * 1024;

/**
 * @brief Pull based byte source.
 *
 * Read() fills at most buffer.size() bytes and returns how many were produced;
 * 0 means end of stream. Short reads are normal and do not signal the end.
 * A reader is consumed once unless IsSeekable() is true, in which case
 * Rewind() restarts it from its first byte.
 */
class IReader
{
    public:
    virtual ~IReader() = default;

    virtual StorageResult<std::size_t> Read(std::span<std::byte> buffer) = 0;

    virtual bool IsSeekable() const { return false; }

    virtual StorageResult<void> Rewind()
    {
        return Storage::MakeError(
            Storage::StorageErrc::Unsupported, Storage::Operation::Read, {},
            "reader cannot be rewound"
        );
    }
};

// Seekable reader over an in-memory buffer, either owned or borrowed.
class BufferReader : public IReader
{
    public:
    explicit BufferReader(std::vector<std::byte> data);

    // Borrows `data`; the caller keeps it alive for the reader's lifetime
    static BufferReader View(std::span<const std::byte> data);

    BufferReader(const BufferReader&)            = delete;
    BufferReader& operator=(const BufferReader&) = delete;
    BufferReader(BufferReader&&)                 = default;
    BufferReader& operator=(BufferReader&&)      = default;

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override;
    bool IsSeekable() const override { return true; }
    StorageResult<void> Rewind() override;

    std::size_t Size() const noexcept { return data_.size(); }

    private:
    BufferReader() = default;

    std::vector<std::byte> owned_;
    std::span<const std::byte> data_;
    std::size_t position_ = 0;
};

// One-pass reader over a std::istream (stdin, sockets, pipes)
class StreamReader : public IReader
{
    public:
    explicit StreamReader(std::istream& stream, std::string label = "stream");

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override;

    private:
    std::istream& stream_;
    std::string label_;
};

// Drains `reader`, checking `cancel` between chunks.
StorageResult<std::vector<std::byte>> ReadToEnd(
    IReader& reader, std::stop_token cancel = {}, const std::string& path = {},
    std::size_t chunk_size = kDefaultChunkSize
);

}  // namespace OmniStore::Io

#endif  // OMNISTORE_SRC_IO_READER_HPP_
