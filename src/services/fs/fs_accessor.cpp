#include "services/fs/fs_accessor.hpp"
#include "io/writer.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace OmniStore::Services
{

namespace fs = std::filesystem;

using Storage::MakeError;
using Storage::ObjectId;
using Storage::ObjectMetadata;
using Storage::Operation;
using Storage::StorageErrc;
using Storage::StorageError;
using Storage::StorageResult;

Storage::StorageError MapFilesystemError(
    const std::error_code& ec, Operation op, const ObjectId& id, const std::string& step
)
{
    StorageErrc storage_errc = StorageErrc::Unexpected;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        storage_errc = Storage::ErrnoToStorageErrc(ec.value());
    }

    if (storage_errc == StorageErrc::Unexpected) {
        spdlog::warn(
            "FsAccessor::MapFilesystemError: Unmapped error during '{}': code={}, category={}, "
            "message='{}'",
            step.empty() ? "operation" : step, ec.value(), ec.category().name(), ec.message()
        );
    } else {
        spdlog::trace(
            "FsAccessor::MapFilesystemError: Mapped error during '{}': code={}, category={}, "
            "message='{}' to StorageErrc {}",
            step.empty() ? "operation" : step, ec.value(), ec.category().name(), ec.message(),
            static_cast<int>(storage_errc)
        );
    }
    return StorageError(storage_errc, op, id.Str(), ec.message());
}

namespace
{

std::unexpected<StorageError> ErrnoError(int err_no, Operation op, const ObjectId& id, const std::string& step)
{
    return std::unexpected(
        MapFilesystemError(std::error_code(err_no, std::generic_category()), op, id, step)
    );
}

class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard()
    {
        if (fd_ >= 0) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "~FileDescriptorGuard: Failed to close fd {}: {}", fd_, std::strerror(errno)
                );
            }
        }
    }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    FileDescriptorGuard(FileDescriptorGuard&& other) noexcept : fd_(other.release()) {}
    FileDescriptorGuard& operator=(FileDescriptorGuard&& other) noexcept
    {
        reset(other.release());
        return *this;
    }
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset(int new_fd = -1) noexcept
    {
        if (fd_ >= 0 && fd_ != new_fd) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "FileDescriptorGuard.reset: Failed to close fd {}: {}", fd_, std::strerror(errno)
                );
            }
        }
        fd_ = new_fd;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

ObjectMetadata MetadataFromStat(const struct stat& stbuf)
{
    ObjectMetadata metadata;
    metadata.is_directory = S_ISDIR(stbuf.st_mode);
    if (!metadata.is_directory) {
        metadata.content_length = static_cast<std::uint64_t>(stbuf.st_size);
    }

    auto mtime = std::chrono::seconds(stbuf.st_mtim.tv_sec) +
                 std::chrono::nanoseconds(stbuf.st_mtim.tv_nsec);
    metadata.last_modified = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(mtime)
    );

    // Weak etag: changes whenever mtime or size does
    char buf[64];
    std::snprintf(
        buf, sizeof(buf), "W/\"%llx-%llx\"",
        static_cast<unsigned long long>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(mtime).count()
        ),
        static_cast<unsigned long long>(stbuf.st_size)
    );
    metadata.etag = buf;
    return metadata;
}

//------------------------------------------------------------------------------//
// FsReader
//------------------------------------------------------------------------------//

class FsReader : public Io::IReader
{
    public:
    FsReader(FileDescriptorGuard fd, std::uint64_t begin, std::uint64_t end, ObjectId id)
        : fd_(std::move(fd)), begin_(begin), end_(end), position_(begin), id_(std::move(id))
    {
    }

    StorageResult<std::size_t> Read(std::span<std::byte> buffer) override
    {
        if (position_ >= end_ || buffer.empty()) {
            return 0;
        }
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), end_ - position_));

        ssize_t bytes_read;
        do {
            bytes_read = ::pread(fd_.get(), buffer.data(), want, static_cast<off_t>(position_));
        } while (bytes_read < 0 && errno == EINTR);

        if (bytes_read < 0) {
            int read_errno = errno;
            spdlog::error(
                "FsReader: pread failed for '{}' at offset {}: {}", id_.Str(), position_,
                std::strerror(read_errno)
            );
            return ErrnoError(read_errno, Operation::Read, id_, "pread");
        }
        position_ += static_cast<std::uint64_t>(bytes_read);
        return static_cast<std::size_t>(bytes_read);
    }

    bool IsSeekable() const override { return true; }

    StorageResult<void> Rewind() override
    {
        position_ = begin_;
        return {};
    }

    private:
    FileDescriptorGuard fd_;
    const std::uint64_t begin_;
    const std::uint64_t end_;
    std::uint64_t position_;
    ObjectId id_;
};

//------------------------------------------------------------------------------//
// FsWriter
//------------------------------------------------------------------------------//

// Writes into a temporary sibling file and renames it over the target on Close()
class FsWriter : public Io::IWriter
{
    public:
    FsWriter(
        FileDescriptorGuard fd, fs::path temp_path, fs::path target_path, ObjectId id,
        std::optional<std::uint64_t> size_hint, std::optional<std::uint64_t> limit
    )
        : fd_(std::move(fd)),
          temp_path_(std::move(temp_path)),
          target_path_(std::move(target_path)),
          id_(std::move(id)),
          size_hint_(size_hint),
          limit_(limit)
    {
    }

    ~FsWriter() override { Abort(); }

    FsWriter(const FsWriter&)            = delete;
    FsWriter& operator=(const FsWriter&) = delete;

    StorageResult<void> Write(std::span<const std::byte> data) override
    {
        if (done_) {
            return MakeError(StorageErrc::Unexpected, Operation::Write, id_.Str(), "writer is closed");
        }
        if (limit_ && written_ + data.size() > *limit_) {
            Abort();
            return MakeError(
                StorageErrc::InvalidInput, Operation::Write, id_.Str(),
                "write exceeds max_write_size of " + std::to_string(*limit_) + " bytes"
            );
        }

        while (!data.empty()) {
            ssize_t bytes_written = ::write(fd_.get(), data.data(), data.size());
            if (bytes_written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int write_errno = errno;
                Abort();
                return ErrnoError(write_errno, Operation::Write, id_, "write");
            }
            written_ += static_cast<std::uint64_t>(bytes_written);
            data = data.subspan(static_cast<std::size_t>(bytes_written));
        }
        return {};
    }

    StorageResult<ObjectMetadata> Close() override
    {
        if (done_) {
            return MakeError(StorageErrc::Unexpected, Operation::Write, id_.Str(), "writer is closed");
        }
        if (size_hint_ && *size_hint_ != written_) {
            Abort();
            return MakeError(
                StorageErrc::InvalidInput, Operation::Write, id_.Str(),
                "size hint " + std::to_string(*size_hint_) + " does not match " +
                    std::to_string(written_) + " bytes written"
            );
        }

        if (::fsync(fd_.get()) == -1) {
            int sync_errno = errno;
            Abort();
            return ErrnoError(sync_errno, Operation::Write, id_, "fsync");
        }
        if (::close(fd_.release()) == -1) {
            int close_errno = errno;
            Abort();
            return ErrnoError(close_errno, Operation::Write, id_, "close");
        }

        std::error_code ec;
        fs::rename(temp_path_, target_path_, ec);
        if (ec) {
            Abort();
            return std::unexpected(MapFilesystemError(ec, Operation::Write, id_, "rename"));
        }
        done_ = true;

        struct stat stbuf{};
        if (::stat(target_path_.c_str(), &stbuf) == -1) {
            // Committed; only the metadata lookup raced with someone else
            spdlog::warn(
                "FsWriter: stat after commit failed for '{}': {}", target_path_.string(),
                std::strerror(errno)
            );
            return ObjectMetadata::File(written_);
        }
        return MetadataFromStat(stbuf);
    }

    void Abort() override
    {
        if (done_) {
            return;
        }
        done_ = true;
        fd_.reset();
        if (::unlink(temp_path_.c_str()) == -1 && errno != ENOENT) {
            spdlog::warn(
                "FsWriter: failed to remove temporary file '{}': {}", temp_path_.string(),
                std::strerror(errno)
            );
        }
    }

    private:
    FileDescriptorGuard fd_;
    fs::path temp_path_;
    fs::path target_path_;
    ObjectId id_;
    const std::optional<std::uint64_t> size_hint_;
    const std::optional<std::uint64_t> limit_;
    std::uint64_t written_ = 0;
    bool done_             = false;
};

//------------------------------------------------------------------------------//
// FsLister
//------------------------------------------------------------------------------//

// Walks one directory level lazily, one directory_iterator step per entry.
// A failed step leaves the iterator at its end and cannot be resumed, so the
// failure is reported as Unexpected and repeated by every later call.
class FsLister : public Io::ILister
{
    public:
    FsLister(fs::directory_iterator it, ObjectId dir, std::stop_token cancel)
        : it_(std::move(it)), dir_(std::move(dir)), cancel_(std::move(cancel))
    {
    }

    StorageResult<std::optional<Storage::DirEntry>> Next() override
    {
        if (failure_) {
            return std::unexpected(*failure_);
        }
        while (it_ != fs::directory_iterator()) {
            if (cancel_.stop_requested()) {
                return Storage::MakeCancelledError(Operation::List, dir_.Str());
            }

            fs::path entry_path = it_->path();
            std::error_code ec;
            it_.increment(ec);
            if (ec) {
                spdlog::warn(
                    "FsLister: Error iterating directory '{}': {}", dir_.Str(), ec.message()
                );
                failure_ = MapFilesystemError(ec, Operation::List, dir_, "listdir_iterate")
                               .WithKind(StorageErrc::Unexpected, "listing interrupted");
                return std::unexpected(*failure_);
            }

            std::string name = entry_path.filename().string();
            if (name.starts_with(FsAccessor::kTempPrefix)) {
                continue;
            }

            struct stat stbuf{};
            if (::stat(entry_path.c_str(), &stbuf) == -1) {
                spdlog::warn(
                    "FsLister: Failed stat for '{}': {}", entry_path.string(), std::strerror(errno)
                );
                continue;
            }

            ObjectMetadata metadata = MetadataFromStat(stbuf);
            if (metadata.is_directory) {
                name += '/';
            }
            return Storage::DirEntry{
                dir_.Join(name), std::move(metadata), it_ != fs::directory_iterator()
            };
        }
        return std::nullopt;
    }

    private:
    fs::directory_iterator it_;
    ObjectId dir_;
    std::stop_token cancel_;
    std::optional<StorageError> failure_;
};

fs::path MakeTempPath(const fs::path& target)
{
    static std::atomic<std::uint64_t> counter{0};
    std::string name = std::string(FsAccessor::kTempPrefix) + std::to_string(::getpid()) + "-" +
                       std::to_string(counter.fetch_add(1)) + "-" + target.filename().string();
    return target.parent_path() / name;
}

}  // anonymous namespace

//------------------------------------------------------------------------------//
// Class Creation and Destruction
//------------------------------------------------------------------------------//

FsAccessor::FsAccessor(const Config::ServiceDefinition& definition)
    : definition_(definition), base_path_(definition.root)
{
    if (base_path_.empty()) {
        throw std::invalid_argument("FsAccessor requires a non-empty root.");
    }

    base_path_                      = fs::absolute(base_path_).lexically_normal();
    info_.scheme                    = Storage::Scheme::Fs;
    info_.root                      = base_path_.string();
    info_.name                      = "fs";
    info_.capability                = Storage::Capability::All();
    info_.capability.max_write_size = definition_.max_write_size;
    spdlog::debug("FsAccessor created for path: {}", base_path_.string());
}

StorageResult<void> FsAccessor::Initialize()
{
    std::error_code ec;
    fs::create_directories(base_path_, ec);
    if (ec) {
        spdlog::error(
            "FsAccessor Initialize: Cannot create root '{}': {}", base_path_.string(), ec.message()
        );
        return std::unexpected(
            MapFilesystemError(ec, Operation::CreateDir, ObjectId::Root(), "initialize_create_root")
        );
    }
    if (!fs::is_directory(base_path_, ec)) {
        spdlog::error("FsAccessor Initialize: Root '{}' is not a directory.", base_path_.string());
        return MakeError(
            StorageErrc::InvalidInput, Operation::Stat, ObjectId::Root().Str(),
            "root is not a directory: " + base_path_.string()
        );
    }

    spdlog::info("FsAccessor initialized using path: {}", base_path_.string());
    return {};
}

fs::path FsAccessor::GetFullPath(const ObjectId& id) const
{
    if (id.IsRoot()) {
        return base_path_;
    }

    std::string_view relative = id.Str();
    if (id.IsDir()) {
        relative.remove_suffix(1);
    }
    auto combined = (base_path_ / relative).lexically_normal();

    std::string base_str = base_path_.string();
    if (base_str.back() != fs::path::preferred_separator) {
        base_str += fs::path::preferred_separator;
    }
    if (combined.string().rfind(base_str, 0) != 0 && combined != base_path_) {
        spdlog::warn(
            "FsAccessor: Potential path traversal detected: id='{}', combined='{}', base='{}'",
            id.Str(), combined.string(), base_path_.string()
        );
        return {};
    }
    return combined;
}

StorageResult<fs::path> FsAccessor::ResolvePath(const ObjectId& id, Operation op) const
{
    auto full_path = GetFullPath(id);
    if (full_path.empty()) {
        return MakeError(StorageErrc::InvalidPath, op, id.Str(), "path escapes backend root");
    }
    return full_path;
}

//------------------------------------------------------------------------------//
// IAccessor Implementation
//------------------------------------------------------------------------------//

StorageResult<std::unique_ptr<Io::IReader>> FsAccessor::Read(const Storage::ReadArgs& args)
{
    if (args.cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::Read, args.id.Str());
    }
    if (args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Read, args.id.Str(), "cannot read a directory"
        );
    }
    auto full_path = ResolvePath(args.id, Operation::Read);
    if (!full_path) {
        return std::unexpected(full_path.error());
    }

    int fd = ::open(full_path->c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int open_errno = errno;
        spdlog::trace(
            "FsAccessor::Read open failed for '{}': {}", full_path->string(),
            std::strerror(open_errno)
        );
        return ErrnoError(open_errno == ENOTDIR ? ENOENT : open_errno, Operation::Read, args.id, "open");
    }
    FileDescriptorGuard fd_guard(fd);

    struct stat stbuf{};
    if (::fstat(fd, &stbuf) == -1) {
        return ErrnoError(errno, Operation::Read, args.id, "fstat");
    }
    if (S_ISDIR(stbuf.st_mode)) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Read, args.id.Str(), "cannot read a directory"
        );
    }

    auto size           = static_cast<std::uint64_t>(stbuf.st_size);
    std::uint64_t begin = 0;
    std::uint64_t end   = size;
    if (args.range) {
        if (args.range->offset > size) {
            return MakeError(
                StorageErrc::InvalidInput, Operation::Read, args.id.Str(),
                "range offset " + std::to_string(args.range->offset) + " is past object size " +
                    std::to_string(size)
            );
        }
        begin = args.range->offset;
        if (args.range->size) {
            end = begin + std::min(size - begin, *args.range->size);
        }
    }
    return std::make_unique<FsReader>(std::move(fd_guard), begin, end, args.id);
}

StorageResult<ObjectMetadata> FsAccessor::Write(const Storage::WriteArgs& args, Io::IReader& reader)
{
    if (args.cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::Write, args.id.Str());
    }
    if (args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Write, args.id.Str(),
            "cannot write to a directory path"
        );
    }
    auto full_path = ResolvePath(args.id, Operation::Write);
    if (!full_path) {
        return std::unexpected(full_path.error());
    }

    // Ensure parent directory exists
    auto parent_path = full_path->parent_path();
    std::error_code ec;
    fs::create_directories(parent_path, ec);
    if (ec) {
        spdlog::error(
            "FsAccessor::Write: Failed create parent dir '{}': {}", parent_path.string(),
            ec.message()
        );
        return std::unexpected(MapFilesystemError(ec, Operation::Write, args.id, "write_create_parent"));
    }

    auto temp_path = MakeTempPath(*full_path);
    int fd         = ::open(temp_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        int create_errno = errno;
        spdlog::trace(
            "FsAccessor::Write: creating '{}' failed: {}", temp_path.string(),
            std::strerror(create_errno)
        );
        return ErrnoError(create_errno, Operation::Write, args.id, "open_temp");
    }

    FsWriter writer(
        FileDescriptorGuard(fd), std::move(temp_path), std::move(*full_path), args.id,
        args.size_hint, definition_.max_write_size
    );
    return Io::CopyToWriter(reader, writer, args.cancel, args.id.Str());
}

StorageResult<void> FsAccessor::Delete(const Storage::DeleteArgs& args)
{
    if (args.cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::Delete, args.id.Str());
    }
    if (args.id.IsRoot()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Delete, args.id.Str(), "cannot delete the root"
        );
    }
    auto full_path = ResolvePath(args.id, Operation::Delete);
    if (!full_path) {
        return std::unexpected(full_path.error());
    }

    struct stat stbuf{};
    if (::lstat(full_path->c_str(), &stbuf) == -1) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return {};
        }
        return ErrnoError(errno, Operation::Delete, args.id, "lstat");
    }
    bool is_dir = S_ISDIR(stbuf.st_mode);
    if (args.id.IsDir() && !is_dir) {
        // No directory by that name
        return {};
    }
    if (!args.id.IsDir() && is_dir) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::Delete, args.id.Str(),
            "target is a directory; delete it through a directory path"
        );
    }

    std::error_code ec;
    fs::remove(*full_path, ec);
    if (ec) {
        spdlog::trace("FsAccessor::Delete failed for '{}': {}", full_path->string(), ec.message());
        return std::unexpected(MapFilesystemError(ec, Operation::Delete, args.id, "remove"));
    }
    return {};
}

StorageResult<ObjectMetadata> FsAccessor::Stat(const Storage::StatArgs& args)
{
    if (args.cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::Stat, args.id.Str());
    }
    auto full_path = ResolvePath(args.id, Operation::Stat);
    if (!full_path) {
        return std::unexpected(full_path.error());
    }

    struct stat stbuf{};
    if (::stat(full_path->c_str(), &stbuf) == -1) {
        int stat_errno = errno;
        spdlog::trace(
            "FsAccessor::Stat failed for '{}': {}", full_path->string(), std::strerror(stat_errno)
        );
        return ErrnoError(stat_errno == ENOTDIR ? ENOENT : stat_errno, Operation::Stat, args.id, "stat");
    }
    if (args.id.IsDir() && !S_ISDIR(stbuf.st_mode)) {
        return MakeError(
            StorageErrc::NotFound, Operation::Stat, args.id.Str(), "not a directory"
        );
    }
    return MetadataFromStat(stbuf);
}

StorageResult<std::unique_ptr<Io::ILister>> FsAccessor::List(const Storage::ListArgs& args)
{
    if (args.cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::List, args.id.Str());
    }
    if (!args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::List, args.id.Str(),
            "list target must be a directory"
        );
    }
    auto full_path = ResolvePath(args.id, Operation::List);
    if (!full_path) {
        return std::unexpected(full_path.error());
    }

    std::error_code ec;
    if (!fs::is_directory(*full_path, ec)) {
        if (ec) {
            spdlog::trace(
                "FsAccessor::List: check failed for '{}': {}", full_path->string(), ec.message()
            );
            return std::unexpected(MapFilesystemError(ec, Operation::List, args.id, "listdir_check_isdir"));
        }
        if (!fs::exists(*full_path, ec)) {
            return MakeError(StorageErrc::NotFound, Operation::List, args.id.Str());
        }
        return MakeError(
            StorageErrc::InvalidInput, Operation::List, args.id.Str(), "not a directory"
        );
    }

    fs::directory_iterator it(*full_path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn(
            "FsAccessor::List: Failed to open directory '{}': {}", full_path->string(), ec.message()
        );
        return std::unexpected(MapFilesystemError(ec, Operation::List, args.id, "listdir_open"));
    }
    return std::make_unique<FsLister>(std::move(it), args.id, args.cancel);
}

StorageResult<void> FsAccessor::CreateDir(const Storage::CreateDirArgs& args)
{
    if (args.cancel.stop_requested()) {
        return Storage::MakeCancelledError(Operation::CreateDir, args.id.Str());
    }
    if (!args.id.IsDir()) {
        return MakeError(
            StorageErrc::InvalidInput, Operation::CreateDir, args.id.Str(),
            "directory path must end with '/'"
        );
    }
    auto full_path = ResolvePath(args.id, Operation::CreateDir);
    if (!full_path) {
        return std::unexpected(full_path.error());
    }

    std::error_code ec;
    auto status = fs::status(*full_path, ec);
    if (fs::exists(status) && !fs::is_directory(status)) {
        return MakeError(
            StorageErrc::AlreadyExists, Operation::CreateDir, args.id.Str(),
            "a file occupies the directory path"
        );
    }

    fs::create_directories(*full_path, ec);
    if (ec) {
        spdlog::trace(
            "FsAccessor::CreateDir failed for '{}': {}", full_path->string(), ec.message()
        );
        return std::unexpected(MapFilesystemError(ec, Operation::CreateDir, args.id, "mkdir"));
    }
    return {};
}

}  // namespace OmniStore::Services
