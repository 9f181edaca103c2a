#ifndef OMNISTORE_SRC_SERVICES_SERVICE_FACTORY_HPP_
#define OMNISTORE_SRC_SERVICES_SERVICE_FACTORY_HPP_

#include "config/config_types.hpp"
#include "services/fs/fs_accessor.hpp"
#include "services/memory/memory_accessor.hpp"
#include "storage/i_accessor.hpp"

#include <memory>

namespace OmniStore::Services
{

class ServiceFactory
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    ServiceFactory()                                 = delete;
    ServiceFactory(const ServiceFactory&)            = delete;
    ServiceFactory& operator=(const ServiceFactory&) = delete;
    ServiceFactory(ServiceFactory&&)                 = delete;
    ServiceFactory& operator=(ServiceFactory&&)      = delete;
    ~ServiceFactory()                                = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Builds the concrete backend for `definition`, ready to serve requests
    static Storage::StorageResult<std::shared_ptr<Storage::IAccessor>> Create(
        const Config::ServiceDefinition& definition
    )
    {
        switch (definition.type) {
            case Storage::Scheme::Memory:
                return std::make_shared<MemoryAccessor>(definition);
            case Storage::Scheme::Fs: {
                auto accessor = std::make_shared<FsAccessor>(definition);
                if (auto init_res = accessor->Initialize(); !init_res) {
                    return std::unexpected(init_res.error());
                }
                return accessor;
            }
            default:
                return Storage::MakeError(
                    Storage::StorageErrc::Unsupported, Storage::Operation::Stat, {},
                    std::string("no built-in service for scheme '") +
                        Storage::SchemeToString(definition.type) + "'"
                );
        }
    }
};

}  // namespace OmniStore::Services

#endif  // OMNISTORE_SRC_SERVICES_SERVICE_FACTORY_HPP_
