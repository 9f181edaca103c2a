#ifndef OMNISTORE_SRC_STORAGE_STORAGE_ERROR_HPP_
#define OMNISTORE_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace OmniStore::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Storage Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,       // Not an error
    NotFound,          // Object or directory does not exist
    AlreadyExists,     // Object exists where the operation requires absence
    PermissionDenied,  // Backend refused access or credentials are missing
    InvalidPath,       // Path escapes the backend root or is malformed
    InvalidInput,      // Malformed argument (range, size, payload)
    Unsupported,       // Operation is not in the accessor capability set
    RateLimited,       // Backend asked us to slow down (retryable)
    Unavailable,       // Transient backend or network failure (retryable)
    Unexpected,        // Anything that could not be classified
};
// clang-format on

// Operation kinds reported with every failure
enum class Operation : std::uint8_t { Read, Write, Delete, Stat, List, CreateDir };

const char* OperationToString(Operation op);

std::error_code make_error_code(StorageErrc e);

// Retryability is fixed per kind
constexpr bool IsRetryable(StorageErrc e)
{
    return e == StorageErrc::RateLimited || e == StorageErrc::Unavailable;
}

// Classification for POSIX-backed drivers
inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageErrc::PermissionDenied;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case EINVAL:
        case ENOTDIR:
        case EISDIR:
        case ENOTEMPTY:
        case EFBIG:
            return StorageErrc::InvalidInput;
        case ENAMETOOLONG:
        case ELOOP:
            return StorageErrc::InvalidPath;
        case EOPNOTSUPP:
        case ENOSYS:
            return StorageErrc::Unsupported;
        case EAGAIN:
        case EINTR:
        case EBUSY:
        case ETIMEDOUT:
        case EMFILE:
        case ENFILE:
            return StorageErrc::Unavailable;

        default:
            return StorageErrc::Unexpected;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "OmniStore::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::NotFound:
                return "Object not found";
            case StorageErrc::AlreadyExists:
                return "Object already exists";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::InvalidPath:
                return "Invalid path";
            case StorageErrc::InvalidInput:
                return "Invalid input";
            case StorageErrc::Unsupported:
                return "Operation not supported";
            case StorageErrc::RateLimited:
                return "Rate limited";
            case StorageErrc::Unavailable:
                return "Service unavailable";
            case StorageErrc::Unexpected:
                return "Unexpected error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

//------------------------------------------------------------------------------//
// Error Value carried by every StorageResult
//------------------------------------------------------------------------------//
class StorageError
{
    public:
    StorageError(StorageErrc kind, Operation op, std::string path, std::string detail = {})
        : code_(make_error_code(kind)), op_(op), path_(std::move(path)), detail_(std::move(detail))
    {
    }

    StorageErrc Kind() const noexcept { return static_cast<StorageErrc>(code_.value()); }
    const std::error_code& Code() const noexcept { return code_; }
    Operation Op() const noexcept { return op_; }
    const std::string& Path() const noexcept { return path_; }
    const std::string& Detail() const noexcept { return detail_; }

    bool IsRetryable() const noexcept { return Storage::IsRetryable(Kind()); }

    // Same error re-tagged with another kind, keeping op, path and detail
    StorageError WithKind(StorageErrc kind, std::string_view note = {}) const;

    std::string ToString() const;

    private:
    std::error_code code_;
    Operation op_;
    std::string path_;
    std::string detail_;
};

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, StorageError>;

inline std::unexpected<StorageError> MakeError(
    StorageErrc kind, Operation op, std::string path, std::string detail = {}
)
{
    return std::unexpected(StorageError(kind, op, std::move(path), std::move(detail)));
}

// Cancellation has no dedicated kind; it is reported as Unexpected.
inline constexpr std::string_view kCancelledDetail = "operation cancelled";

inline std::unexpected<StorageError> MakeCancelledError(Operation op, std::string path)
{
    return MakeError(StorageErrc::Unexpected, op, std::move(path), std::string(kCancelledDetail));
}

inline bool IsCancelled(const StorageError& error)
{
    return error.Kind() == StorageErrc::Unexpected && error.Detail() == kCancelledDetail;
}

}  // namespace OmniStore::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<OmniStore::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // OMNISTORE_SRC_STORAGE_STORAGE_ERROR_HPP_
