#ifndef OMNISTORE_SRC_OPERATOR_OPERATOR_HPP_
#define OMNISTORE_SRC_OPERATOR_OPERATOR_HPP_

#include "app_constants.hpp"
#include "async_io_manager.hpp"
#include "config/config_types.hpp"
#include "credential/credential_resolver.hpp"
#include "io/lister.hpp"
#include "io/reader.hpp"
#include "layers/retry_policy.hpp"
#include "storage/i_accessor.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace OmniStore
{

using Storage::StorageResult;

struct OperatorOptions {
    // std::nullopt leaves the retry layer out of the stack
    std::optional<Layers::RetryPolicy> retry = Layers::RetryPolicy{};

    // Required when the backend capability sets needs_credential
    std::shared_ptr<Credential::ICredentialResolver> credential_resolver;

    std::size_t io_threads = Constants::DEFAULT_IO_THREADS;

    Layers::Sleeper retry_sleeper     = Layers::InterruptibleSleep;
    Layers::JitterSource retry_jitter = Layers::DefaultJitter;
};

/**
 * @brief Public entry point of the library.
 *
 * Builds the accessor stack once (retry, then range, then credentials when the
 * backend asks for them, then the backend) and exposes one method per
 * operation. Every call normalizes its path and checks the capability set
 * before anything is dispatched; rejected calls never reach the backend.
 *
 * Methods are safe to call concurrently. Calls on the same path are not
 * ordered against each other; wait for a write before reading it back.
 * Readers and listers handed out stay valid after the Operator is gone.
 */
class Operator
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    static StorageResult<std::unique_ptr<Operator>> Create(
        std::shared_ptr<Storage::IAccessor> backend, OperatorOptions options = {}
    );
    static StorageResult<std::unique_ptr<Operator>> FromConfig(const Config::OperatorConfig& config);

    ~Operator() = default;

    Operator(const Operator&)            = delete;
    Operator& operator=(const Operator&) = delete;
    Operator(Operator&&)                 = delete;
    Operator& operator=(Operator&&)      = delete;

    //------------------------------------------------------------------------------//
    // Synchronous Operations
    //------------------------------------------------------------------------------//

    // Opens `path` for streaming. A negative offset or length is InvalidInput.
    StorageResult<std::unique_ptr<Io::IReader>> Read(
        std::string_view path, std::int64_t offset = 0,
        std::optional<std::int64_t> length = std::nullopt, std::stop_token cancel = {}
    );
    StorageResult<std::vector<std::byte>> ReadAll(
        std::string_view path, std::int64_t offset = 0,
        std::optional<std::int64_t> length = std::nullopt, std::stop_token cancel = {}
    );

    // Consumes `reader` completely. Only seekable readers are retried.
    StorageResult<Storage::ObjectMetadata> Write(
        std::string_view path, Io::IReader& reader,
        std::optional<std::uint64_t> size_hint = std::nullopt, std::stop_token cancel = {}
    );
    StorageResult<Storage::ObjectMetadata> Write(
        std::string_view path, std::span<const std::byte> data, std::stop_token cancel = {}
    );

    StorageResult<void> Delete(std::string_view path, std::stop_token cancel = {});
    StorageResult<Storage::ObjectMetadata> Stat(std::string_view path, std::stop_token cancel = {});
    StorageResult<bool> IsExist(std::string_view path, std::stop_token cancel = {});

    // `path` names a directory; a missing trailing '/' is implied
    StorageResult<std::unique_ptr<Io::ILister>> List(std::string_view path, std::stop_token cancel = {});
    StorageResult<std::vector<Storage::DirEntry>> ListAll(
        std::string_view path, std::stop_token cancel = {}
    );
    StorageResult<void> CreateDir(std::string_view path, std::stop_token cancel = {});

    [[nodiscard]] Storage::AccessorInfo Info() const { return info_; }

    //------------------------------------------------------------------------------//
    // Asynchronous Operations
    //------------------------------------------------------------------------------//

    std::future<StorageResult<std::vector<std::byte>>> ReadAllAsync(
        std::string path, std::int64_t offset = 0,
        std::optional<std::int64_t> length = std::nullopt, std::stop_token cancel = {}
    );
    std::future<StorageResult<Storage::ObjectMetadata>> WriteAsync(
        std::string path, std::vector<std::byte> data, std::stop_token cancel = {}
    );
    std::future<StorageResult<Storage::ObjectMetadata>> StatAsync(
        std::string path, std::stop_token cancel = {}
    );
    std::future<StorageResult<void>> DeleteAsync(std::string path, std::stop_token cancel = {});
    std::future<StorageResult<std::vector<Storage::DirEntry>>> ListAllAsync(
        std::string path, std::stop_token cancel = {}
    );
    std::future<StorageResult<void>> CreateDirAsync(std::string path, std::stop_token cancel = {});

    private:
    Operator(std::shared_ptr<Storage::IAccessor> stack, std::size_t io_threads);

    StorageResult<Storage::ObjectId> Prepare(std::string_view path, Storage::Operation op) const;
    StorageResult<Storage::ObjectId> PrepareDir(std::string_view path, Storage::Operation op) const;

    std::shared_ptr<Storage::IAccessor> stack_;
    const Storage::AccessorInfo info_;

    // Declared last so workers are joined before the stack goes away
    AsyncIoManager io_manager_;
};

}  // namespace OmniStore

#endif  // OMNISTORE_SRC_OPERATOR_OPERATOR_HPP_
