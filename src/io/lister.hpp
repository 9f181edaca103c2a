#ifndef OMNISTORE_SRC_IO_LISTER_HPP_
#define OMNISTORE_SRC_IO_LISTER_HPP_

#include "storage/metadata.hpp"
#include "storage/object_id.hpp"
#include "storage/storage_error.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace OmniStore::Io
{

using Storage::DirEntry;
using Storage::StorageResult;

// Lazy sequence of directory entries. Next() yields std::nullopt once the
// listing is exhausted. Dropping a lister early is always safe.
class ILister
{
    public:
    virtual ~ILister() = default;

    virtual StorageResult<std::optional<DirEntry>> Next() = 0;
};

struct ListPage {
    std::vector<DirEntry> entries;
    std::optional<std::string> next_token;  ///< Absent on the last page
};

// Called with std::nullopt for the first page, then with the previous
// page's next_token.
using PageFetcher = std::function<StorageResult<ListPage>(const std::optional<std::string>& token)>;

/**
 * @brief Lister that pulls pages from a backend only on demand.
 *
 * A page is requested when the buffered one is exhausted and the caller asks
 * for another entry, never ahead of time. A failed fetch leaves the
 * continuation token untouched, so calling Next() again repeats that fetch.
 */
class PagedLister : public ILister
{
    public:
    PagedLister(PageFetcher fetcher, std::string dir, std::stop_token cancel = {});

    StorageResult<std::optional<DirEntry>> Next() override;

    std::size_t FetchCount() const noexcept { return fetch_count_; }

    private:
    PageFetcher fetcher_;
    std::string dir_;
    std::stop_token cancel_;

    std::vector<DirEntry> page_;
    std::size_t index_ = 0;
    std::optional<std::string> token_;
    bool exhausted_          = false;
    std::size_t fetch_count_ = 0;
};

// Single page lister over entries already in memory
class VectorLister : public ILister
{
    public:
    explicit VectorLister(std::vector<DirEntry> entries) : entries_(std::move(entries)) {}

    StorageResult<std::optional<DirEntry>> Next() override;

    private:
    std::vector<DirEntry> entries_;
    std::size_t index_ = 0;
};

StorageResult<std::vector<DirEntry>> CollectAll(ILister& lister, std::stop_token cancel = {});

}  // namespace OmniStore::Io

#endif  // OMNISTORE_SRC_IO_LISTER_HPP_
