#ifndef __DISPATCHER_HPP__
#define __DISPATCHER_HPP__

#include "../network/message.hpp"
#include "../registry/replica_registry.hpp"
#include "../replication/replica_api.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace passive_kv
{
    // Client-facing front end. Forwards every request to the current primary
    // and, when it stops answering, promotes queued backups in FIFO order until
    // one accepts. A background loop seeds replicas that join later.
    class Dispatcher
    {
    public:
        Dispatcher(ReplicaRegistryPtr registry,
                   ReplicaHandlePtr primary,
                   std::vector<ReplicaHandlePtr> backups,
                   std::string name_prefix = "replica",
                   std::chrono::milliseconds discovery_interval = std::chrono::milliseconds(5000));
        ~Dispatcher();

        Dispatcher(const Dispatcher &) = delete;
        Dispatcher &operator=(const Dispatcher &) = delete;

        // Lifecycle of the discovery loop
        Status start();
        void stop();
        bool isRunning() const noexcept { return _running; }

        // UNAVAILABLE once the primary and every queued backup have failed
        Result<bool> put(const Key &key, const Value &value);
        Result<std::optional<Value>> get(const Key &key);

        Status failoverToBackup(const ReplicaHandlePtr &candidate);

        // One discovery pass; normally driven by the background loop
        void discoverNewReplicas();

        // Servant entry point for the client-facing TcpServer
        std::unique_ptr<Message> handleMessage(const Message &request);

        [[nodiscard]] ReplicaHandlePtr getCurrentPrimary() const;
        // Empty when no primary is installed
        [[nodiscard]] std::string getCurrentPrimaryName() const;
        [[nodiscard]] std::vector<std::string> getBackupQueueNames() const;
        [[nodiscard]] std::vector<std::string> getIgnoredNames() const;

    private:
        ReplicaRegistryPtr _registry;
        std::string _name_prefix;
        std::chrono::milliseconds _discovery_interval;

        // Read with std::atomic_load, written with std::atomic_store under _state_mutex
        ReplicaHandlePtr _current_primary;

        mutable std::mutex _state_mutex;
        std::deque<ReplicaHandlePtr> _backup_queue;
        std::unordered_set<std::string> _ignored_names;

        std::atomic<bool> _running;
        std::atomic<bool> _should_stop;
        std::unique_ptr<std::thread> _discovery_thread;
        std::mutex _discovery_mutex;
        std::condition_variable _discovery_condition;

        template <typename T, typename Operation>
        Result<T> invokeOnPrimary(const char *operation_name, Operation operation);

        // Next primary to try after `failed` stopped answering; nullptr once backups are exhausted
        ReplicaHandlePtr failoverFrom(const ReplicaHandlePtr &failed);

        void discoveryLoop();
        void ignoreName(const std::string &name, const char *reason);

        // Caller holds _state_mutex
        bool isKnown(const std::string &name) const;
        void removeFromQueue(const std::string &name);
    };
} // namespace passive_kv

#endif // __DISPATCHER_HPP__
