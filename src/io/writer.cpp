#include "io/writer.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <vector>

namespace OmniStore::Io
{

StorageResult<Storage::ObjectMetadata> CopyToWriter(
    IReader& reader, IWriter& writer, std::stop_token cancel, const std::string& path,
    std::size_t chunk_size
)
{
    std::vector<std::byte> chunk(chunk_size);
    std::uint64_t copied = 0;

    while (true) {
        if (cancel.stop_requested()) {
            spdlog::debug("CopyToWriter: '{}' cancelled after {} bytes", path, copied);
            writer.Abort();
            return Storage::MakeCancelledError(Storage::Operation::Write, path);
        }

        auto read_res = reader.Read(chunk);
        if (!read_res) {
            writer.Abort();
            return std::unexpected(read_res.error());
        }
        if (*read_res == 0) {
            break;
        }

        auto write_res = writer.Write(std::span<const std::byte>(chunk.data(), *read_res));
        if (!write_res) {
            writer.Abort();
            return std::unexpected(write_res.error());
        }
        copied += *read_res;
    }

    spdlog::trace("CopyToWriter: committing {} bytes to '{}'", copied, path);
    return writer.Close();
}

}  // namespace OmniStore::Io
