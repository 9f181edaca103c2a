#include "io/reader.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>

namespace OmniStore::Io
{

using Storage::MakeError;
using Storage::Operation;
using Storage::StorageErrc;

//------------------------------------------------------------------------------//
// BufferReader
//------------------------------------------------------------------------------//

BufferReader::BufferReader(std::vector<std::byte> data) : owned_(std::move(data)), data_(owned_) {}

BufferReader BufferReader::View(std::span<const std::byte> data)
{
    BufferReader reader;
    reader.data_ = data;
    return reader;
}

StorageResult<std::size_t> BufferReader::Read(std::span<std::byte> buffer)
{
    std::size_t available = data_.size() - position_;
    std::size_t count     = std::min(available, buffer.size());
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

StorageResult<void> BufferReader::Rewind()
{
    position_ = 0;
    return {};
}

//------------------------------------------------------------------------------//
// StreamReader
//------------------------------------------------------------------------------//

StreamReader::StreamReader(std::istream& stream, std::string label)
    : stream_(stream), label_(std::move(label))
{
}

StorageResult<std::size_t> StreamReader::Read(std::span<std::byte> buffer)
{
    if (buffer.empty() || stream_.eof()) {
        return 0;
    }
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (stream_.bad()) {
        spdlog::error("StreamReader: unrecoverable stream error on '{}'", label_);
        return MakeError(StorageErrc::Unexpected, Operation::Read, label_, "input stream failed");
    }
    return static_cast<std::size_t>(stream_.gcount());
}

//------------------------------------------------------------------------------//
// Helpers
//------------------------------------------------------------------------------//

StorageResult<std::vector<std::byte>> ReadToEnd(
    IReader& reader, std::stop_token cancel, const std::string& path, std::size_t chunk_size
)
{
    std::vector<std::byte> out;
    std::vector<std::byte> chunk(chunk_size);
    while (true) {
        if (cancel.stop_requested()) {
            return Storage::MakeCancelledError(Operation::Read, path);
        }
        auto read_res = reader.Read(chunk);
        if (!read_res) {
            return std::unexpected(read_res.error());
        }
        if (*read_res == 0) {
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*read_res));
    }
    return out;
}

}  // namespace OmniStore::Io
