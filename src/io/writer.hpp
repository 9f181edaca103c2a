#ifndef OMNISTORE_SRC_IO_WRITER_HPP_
#define OMNISTORE_SRC_IO_WRITER_HPP_

#include "io/reader.hpp"
#include "storage/metadata.hpp"
#include "storage/storage_error.hpp"

#include <cstddef>
#include <span>
#include <stop_token>
#include <string>

namespace OmniStore::Io
{

/**
 * @brief Push based byte sink owned by a backend.
 *
 * Bytes handed to Write() become visible only once Close() succeeds; a writer
 * that is aborted, or destroyed without Close(), must leave the previous
 * object state untouched. How strong that guarantee is depends on the backend
 * and is documented there.
 */
class IWriter
{
    public:
    virtual ~IWriter() = default;

    virtual StorageResult<void> Write(std::span<const std::byte> data) = 0;

    // Commits the object and returns its metadata
    virtual StorageResult<Storage::ObjectMetadata> Close() = 0;

    // Drops everything written so far. Safe to call more than once.
    virtual void Abort() = 0;
};

// Pumps `reader` into `writer` and commits. On any failure, cancellation
// included, the writer is aborted before the error is returned.
StorageResult<Storage::ObjectMetadata> CopyToWriter(
    IReader& reader, IWriter& writer, std::stop_token cancel = {}, const std::string& path = {},
    std::size_t chunk_size = kDefaultChunkSize
);

}  // namespace OmniStore::Io

#endif  // OMNISTORE_SRC_IO_WRITER_HPP_
