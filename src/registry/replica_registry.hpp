#ifndef __REPLICA_REGISTRY_HPP__
#define __REPLICA_REGISTRY_HPP__

#include "../common/types.hpp"
#include "../replication/replica_api.hpp"
#include <memory>
#include <string>
#include <vector>

namespace passive_kv
{
    // Name service through which replicas and the dispatcher find each other
    class ReplicaRegistry
    {
    public:
        virtual ~ReplicaRegistry() = default;

        virtual Status publish(const std::string &name, const std::string &address, Port port) = 0;

        // NOT_FOUND for an unknown name, NETWORK_ERROR when the registry is unreachable
        virtual Result<ReplicaHandlePtr> lookup(const std::string &name) = 0;

        virtual Result<std::vector<std::string>> listNames() = 0;
    };

    using ReplicaRegistryPtr = std::shared_ptr<ReplicaRegistry>;
} // namespace passive_kv

#endif // __REPLICA_REGISTRY_HPP__
