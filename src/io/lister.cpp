#include "io/lister.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace OmniStore::Io
{

PagedLister::PagedLister(PageFetcher fetcher, std::string dir, std::stop_token cancel)
    : fetcher_(std::move(fetcher)), dir_(std::move(dir)), cancel_(std::move(cancel))
{
}

StorageResult<std::optional<DirEntry>> PagedLister::Next()
{
    while (index_ >= page_.size()) {
        if (exhausted_) {
            return std::nullopt;
        }
        if (cancel_.stop_requested()) {
            return Storage::MakeCancelledError(Storage::Operation::List, dir_);
        }

        auto page_res = fetcher_(token_);
        if (!page_res) {
            spdlog::debug(
                "PagedLister: page fetch for '{}' failed: {}", dir_, page_res.error().ToString()
            );
            return std::unexpected(page_res.error());
        }
        ++fetch_count_;

        page_  = std::move(page_res->entries);
        index_ = 0;
        if (page_res->next_token) {
            token_ = std::move(page_res->next_token);
        } else {
            exhausted_ = true;
        }
        spdlog::trace(
            "PagedLister: fetched page {} of '{}' with {} entries", fetch_count_, dir_, page_.size()
        );
    }

    DirEntry entry = std::move(page_[index_++]);
    entry.has_more = index_ < page_.size() || !exhausted_;
    return entry;
}

StorageResult<std::optional<DirEntry>> VectorLister::Next()
{
    if (index_ >= entries_.size()) {
        return std::nullopt;
    }
    DirEntry entry = std::move(entries_[index_++]);
    entry.has_more = index_ < entries_.size();
    return entry;
}

StorageResult<std::vector<DirEntry>> CollectAll(ILister& lister, std::stop_token cancel)
{
    std::vector<DirEntry> entries;
    while (true) {
        if (cancel.stop_requested()) {
            return Storage::MakeCancelledError(Storage::Operation::List, {});
        }
        auto next_res = lister.Next();
        if (!next_res) {
            return std::unexpected(next_res.error());
        }
        if (!next_res->has_value()) {
            break;
        }
        entries.push_back(std::move(**next_res));
    }
    return entries;
}

}  // namespace OmniStore::Io
