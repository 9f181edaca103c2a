#include "services/memory/memory_accessor.hpp"
#include "io/writer.hpp"

#include <boost/container_hash/hash.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>

namespace OmniStore::Services
{

using Storage::MakeError;
using Storage::ObjectId;
using Storage::ObjectMetadata;
using Storage::Operation;
using Storage::StorageErrc;
using Storage::StorageResult;

namespace
{

// Seekable view over a committed object; keeps the bytes alive on its own
class SharedBytesReader : public Io::IReader
{
    public:
    SharedBytesReader(
        std::shared_ptr<const std::vector<std::byte>> data, std::size_t begin, std::size_t end
    )
        : data_(std::move(data)), begin_(begin), end_(end), position_(begin)
    {
    }

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override
    {
        std::size_t count = std::min(buffer.size(), end_ - position_);
        std::copy_n(data_->begin() + static_cast<std::ptrdiff_t>(position_), count, buffer.begin());
        position_ += count;
        return count;
    }

    bool IsSeekable() const override { return true; }

    StorageResult<void> Rewind() override
    {
        position_ = begin_;
        return {};
    }

    private:
    std::shared_ptr<const std::vector<std::byte>> data_;
    const std::size_t begin_;
    const std::size_t end_;
    std::size_t position_;
};

// Buffers the object and hands it to `commit` on Close()
class MemoryWriter : public Io::IWriter
{
    public:
    using CommitFn = std::function<StorageResult<ObjectMetadata>(std::vector<std::byte>)>;

    MemoryWriter(CommitFn commit, std::optional<std::uint64_t> limit, std::string path)
        : commit_(std::move(commit)), limit_(limit), path_(std::move(path))
    {
    }

    StorageResult<void> Write(std::span<const std::byte> data) override
    {
        if (closed_) {
            return MakeError(StorageErrc::Unexpected, Operation::Write, path_, "writer is closed");
        }
        if (limit_ && buffer_.size() + data.size() > *limit_) {
            Abort();
            return MakeError(
                StorageErrc::InvalidInput, Operation::Write, path_,
                "write exceeds max_write_size of " + std::to_string(*limit_) + " bytes"
            );
        }
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return {};
    }

    StorageResult<ObjectMetadata> Close() override
    {
        if (closed_) {
            return MakeError(StorageErrc::Unexpected, Operation::Write, path_, "writer is closed");
        }
        closed_ = true;
        return commit_(std::move(buffer_));
    }

    void Abort() override
    {
        closed_ = true;
        buffer_.clear();
        buffer_.shrink_to_fit();
    }

    private:
    CommitFn commit_;
    const std::optional<std::uint64_t> limit_;
    std::string path_;
    std::vector<std::byte> buffer_;
    bool closed_ = false;
};

std::string MakeEtag(const std::vector<std::byte>& data)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    std::size_t seed  = boost::hash_range(bytes, bytes + data.size());
    boost::hash_combine(seed, data.size());

    char buf[32];
    std::snprintf(buf, sizeof(buf), "\"%016zx\"", seed);
    return buf;
}

// Smallest key strictly above every key that starts with `dir_prefix`
std::string PrefixSuccessor(std::string dir_prefix)
{
    dir_prefix.back() = static_cast<char>('/' + 1);
    return dir_prefix;
}

StorageResult<void> CheckCancelled(const std::stop_token& cancel, Operation op, const ObjectId& id)
{
    if (cancel.stop_requested()) {
        return Storage::MakeCancelledError(op, id.Str());
    }
    return {};
}

}  // anonymous namespace

//------------------------------------------------------------------------------//
// Class Creation and Destruction
//------------------------------------------------------------------------------//

MemoryAccessor::MemoryAccessor(const Config::ServiceDefinition& definition)
    : definition_(definition)
{
    if (definition_.list_page_size == 0) {
        throw std::invalid_argument("MemoryAccessor requires a positive list_page_size.");
    }
    info_.scheme                    = Storage::Scheme::Memory;
    info_.root                      = definition_.root.empty() ? "/" : definition_.root.string();
    info_.name                      = "memory";
    info_.capability                = Storage::Capability::All();
    info_.capability.max_write_size = definition_.max_write_size;
    spdlog::debug("MemoryAccessor created with root '{}'", info_.root);
}

std::size_t MemoryAccessor::ObjectCount() const
{
    std::shared_lock lock(objects_mutex_);
    return objects_.size();
}

//------------------------------------------------------------------------------//
// IAccessor Implementation
//------------------------------------------------------------------------------//

StorageResult<std::unique_ptr<Io::IReader>> MemoryAccessor::Read(const Storage::ReadArgs& args)
{
    if (auto check = CheckCancelled(args.cancel, Operation::Read, args.id); !check) {
        return std::unexpected(check.error());
    }
    if (args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Read, args.id.Str(), "cannot read a directory"
        );
    }

    std::shared_ptr<const std::vector<std::byte>> data;
    {
        std::shared_lock lock(objects_mutex_);
        const auto& index = objects_.get<by_key>();
        auto it           = index.find(args.id.Str());
        if (it == index.end()) {
            spdlog::trace("MemoryAccessor::Read: '{}' not found", args.id.Str());
            return MakeError(StorageErrc::NotFound, Operation::Read, args.id.Str());
        }
        data = it->data;
    }

    std::size_t begin = 0;
    std::size_t end   = data->size();
    if (args.range) {
        if (args.range->offset > data->size()) {
            return MakeError(
                StorageErrc::InvalidInput, Operation::Read, args.id.Str(),
                "range offset " + std::to_string(args.range->offset) + " is past object size " +
                    std::to_string(data->size())
            );
        }
        begin = static_cast<std::size_t>(args.range->offset);
        if (args.range->size) {
            std::uint64_t available = data->size() - begin;
            end = begin + static_cast<std::size_t>(std::min(available, *args.range->size));
        }
    }
    return std::make_unique<SharedBytesReader>(std::move(data), begin, end);
}

StorageResult<ObjectMetadata> MemoryAccessor::Write(const Storage::WriteArgs& args, Io::IReader& reader)
{
    if (auto check = CheckCancelled(args.cancel, Operation::Write, args.id); !check) {
        return std::unexpected(check.error());
    }
    if (args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Write, args.id.Str(),
            "cannot write to a directory path"
        );
    }

    MemoryWriter writer(
        [this, &args](std::vector<std::byte> data) {
            return Commit(args, std::move(data));
        },
        definition_.max_write_size, args.id.Str()
    );
    return Io::CopyToWriter(reader, writer, args.cancel, args.id.Str());
}

StorageResult<ObjectMetadata> MemoryAccessor::Commit(
    const Storage::WriteArgs& args, std::vector<std::byte> data
)
{
    if (args.size_hint && *args.size_hint != data.size()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Write, args.id.Str(),
            "size hint " + std::to_string(*args.size_hint) + " does not match " +
                std::to_string(data.size()) + " bytes written"
        );
    }

    ObjectMetadata metadata = ObjectMetadata::File(data.size());
    metadata.last_modified  = std::chrono::system_clock::now();
    metadata.etag           = MakeEtag(data);
    auto shared_data        = std::make_shared<const std::vector<std::byte>>(std::move(data));

    std::unique_lock lock(objects_mutex_);
    auto& index = objects_.get<by_key>();
    auto it     = index.find(args.id.Str());
    if (it != index.end()) {
        index.modify(it, [&](MemoryObject& object) {
            object.data     = shared_data;
            object.metadata = metadata;
        });
    } else {
        index.insert(MemoryObject{args.id.Str(), shared_data, metadata});
    }
    spdlog::trace(
        "MemoryAccessor: committed '{}' ({} bytes)", args.id.Str(), *metadata.content_length
    );
    return metadata;
}

StorageResult<void> MemoryAccessor::Delete(const Storage::DeleteArgs& args)
{
    if (auto check = CheckCancelled(args.cancel, Operation::Delete, args.id); !check) {
        return check;
    }
    if (args.id.IsRoot()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Delete, args.id.Str(), "cannot delete the root"
        );
    }

    std::unique_lock lock(objects_mutex_);
    if (args.id.IsDir()) {
        // Only the marker may go; anything else under the prefix keeps the directory alive
        const auto& ordered = objects_.get<by_order>();
        auto it             = ordered.lower_bound(args.id.Str());
        auto end            = ordered.lower_bound(PrefixSuccessor(args.id.Str()));
        for (; it != end; ++it) {
            if (it->key != args.id.Str()) {
                return MakeError(
                    StorageErrc::InvalidInput, Operation::Delete, args.id.Str(),
                    "directory not empty"
                );
            }
        }
    }
    objects_.get<by_key>().erase(args.id.Str());
    return {};
}

StorageResult<ObjectMetadata> MemoryAccessor::Stat(const Storage::StatArgs& args)
{
    if (auto check = CheckCancelled(args.cancel, Operation::Stat, args.id); !check) {
        return std::unexpected(check.error());
    }
    if (args.id.IsRoot()) {
        return ObjectMetadata::Directory();
    }

    std::shared_lock lock(objects_mutex_);
    const auto& index = objects_.get<by_key>();
    auto it           = index.find(args.id.Str());
    if (it != index.end()) {
        return it->metadata;
    }
    if (args.id.IsDir()) {
        // Implicit directory: some key lives under the prefix
        const auto& ordered = objects_.get<by_order>();
        auto child          = ordered.lower_bound(args.id.Str());
        if (child != ordered.end() && child->key.starts_with(args.id.Str())) {
            return ObjectMetadata::Directory();
        }
    }
    return MakeError(StorageErrc::NotFound, Operation::Stat, args.id.Str());
}

StorageResult<std::unique_ptr<Io::ILister>> MemoryAccessor::List(const Storage::ListArgs& args)
{
    if (auto check = CheckCancelled(args.cancel, Operation::List, args.id); !check) {
        return std::unexpected(check.error());
    }
    if (!args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::List, args.id.Str(),
            "list target must be a directory"
        );
    }

    ObjectId dir = args.id;
    return std::make_unique<Io::PagedLister>(
        [this, dir](const std::optional<std::string>& token) {
            return FetchPage(dir, token);
        },
        dir.Str(), args.cancel
    );
}

StorageResult<Io::ListPage> MemoryAccessor::FetchPage(
    const ObjectId& dir, const std::optional<std::string>& token
) const
{
    const std::string prefix = dir.IsRoot() ? std::string() : dir.Str();

    std::shared_lock lock(objects_mutex_);
    const auto& ordered = objects_.get<by_order>();
    auto it             = ordered.lower_bound(token.value_or(prefix));
    auto end =
        prefix.empty() ? ordered.end() : ordered.lower_bound(PrefixSuccessor(prefix));

    Io::ListPage page;
    std::string resume_key;
    while (it != end && page.entries.size() < definition_.list_page_size) {
        std::string_view rest = std::string_view(it->key).substr(prefix.size());
        if (rest.empty()) {
            // The directory's own marker
            ++it;
            continue;
        }

        size_t slash = rest.find('/');
        if (slash == std::string_view::npos) {
            page.entries.push_back(
                Storage::DirEntry{dir.Join(rest), it->metadata, false}
            );
            resume_key = it->key + '\0';
            ++it;
            continue;
        }

        // Explicit marker or implicit directory; emitted once, then skipped past
        std::string child_dir = prefix + std::string(rest.substr(0, slash + 1));
        page.entries.push_back(Storage::DirEntry{
            dir.Join(rest.substr(0, slash + 1)), ObjectMetadata::Directory(), false
        });
        resume_key = PrefixSuccessor(child_dir);
        it         = ordered.lower_bound(resume_key);
    }

    if (it != end) {
        page.next_token = resume_key;
    }
    return page;
}

StorageResult<void> MemoryAccessor::CreateDir(const Storage::CreateDirArgs& args)
{
    if (auto check = CheckCancelled(args.cancel, Operation::CreateDir, args.id); !check) {
        return check;
    }
    if (!args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::CreateDir, args.id.Str(),
            "directory path must end with '/'"
        );
    }
    if (args.id.IsRoot()) {
        return {};
    }

    ObjectMetadata metadata = ObjectMetadata::Directory();
    metadata.last_modified  = std::chrono::system_clock::now();

    std::unique_lock lock(objects_mutex_);
    // insert() is a no-op for an existing marker
    objects_.insert(MemoryObject{args.id.Str(), nullptr, metadata});
    return {};
}

}  // namespace OmniStore::Services
