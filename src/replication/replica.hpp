#ifndef __REPLICA_HPP__
#define __REPLICA_HPP__

#include "replica_api.hpp"
#include "../network/message.hpp"
#include "../registry/replica_registry.hpp"
#include "../storage/storage_engine.hpp"
#include <mutex>
#include <unordered_set>
#include <vector>

namespace passive_kv
{
    enum class ReplicaRole : std::uint8_t
    {
        BACKUP,
        PRIMARY
    };

    [[nodiscard]] std::string replicaRoleToString(ReplicaRole role);

    // A key-value store that is either the primary (accepts writes and pushes
    // the full post-write state to every live backup before acknowledging) or
    // a backup (accepts state pushes and waits to be promoted).
    class Replica : public ReplicaHandle
    {
    public:
        Replica(ReplicaId id, ReplicaRole role, ReplicaRegistryPtr registry,
                std::string name_prefix = "replica",
                std::vector<ReplicaHandlePtr> initial_backups = {});

        Replica(const Replica &) = delete;
        Replica &operator=(const Replica &) = delete;

        // Client-op surface
        Result<bool> handleClientPut(const Key &key, const Value &value) override;
        Result<std::optional<Value>> handleClientGet(const Key &key) override;
        Result<Snapshot> getState() override;

        // Control surface
        Status pushFullState(const Snapshot &snapshot) override;
        Status promoteToPrimary() override;
        Status ping() override;

        [[nodiscard]] const std::string &getName() const override { return _name; }
        [[nodiscard]] ReplicaId getId() const noexcept { return _id; }
        [[nodiscard]] ReplicaRole getRole() const;
        [[nodiscard]] bool isPrimary() const { return getRole() == ReplicaRole::PRIMARY; }
        [[nodiscard]] std::vector<std::string> getBackupNames() const;
        [[nodiscard]] std::vector<std::string> getIgnoredNames() const;

        // Servant entry point for the replica's TcpServer
        std::unique_ptr<Message> handleMessage(const Message &request);

    private:
        const ReplicaId _id;
        const std::string _name_prefix;
        const std::string _name;
        ReplicaRegistryPtr _registry;

        // Guards role, store, backups and ignored names as a unit
        mutable std::mutex _state_mutex;
        ReplicaRole _role;
        InMemoryStorageEngine _store;
        std::vector<ReplicaHandlePtr> _backups;
        std::unordered_set<std::string> _ignored_names;

        // Caller holds _state_mutex
        std::vector<ReplicaHandlePtr> discoverBackups();
    };
} // namespace passive_kv

#endif // __REPLICA_HPP__
