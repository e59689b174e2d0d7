#ifndef __REPLICA_API_HPP__
#define __REPLICA_API_HPP__

#include "../common/types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace passive_kv
{
    // Operations a client (in practice, the dispatcher) invokes on the primary
    class PrimaryApi
    {
    public:
        virtual ~PrimaryApi() = default;

        // false when the target is not the primary; no state is touched in that case
        virtual Result<bool> handleClientPut(const Key &key, const Value &value) = 0;
        virtual Result<std::optional<Value>> handleClientGet(const Key &key) = 0;
        virtual Result<Snapshot> getState() = 0;
    };

    // Operations used between replicas and by the dispatcher's failover and discovery
    class ReplicaControl
    {
    public:
        virtual ~ReplicaControl() = default;

        virtual Status pushFullState(const Snapshot &snapshot) = 0;
        virtual Status promoteToPrimary() = 0;
        virtual Status ping() = 0;
    };

    // Both surfaces of one replica, identified by its registry name
    class ReplicaHandle : public PrimaryApi, public ReplicaControl
    {
    public:
        ~ReplicaHandle() override = default;

        [[nodiscard]] virtual const std::string &getName() const = 0;
    };

    using ReplicaHandlePtr = std::shared_ptr<ReplicaHandle>;
} // namespace passive_kv

#endif // __REPLICA_API_HPP__
