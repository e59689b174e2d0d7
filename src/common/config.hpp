#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#include "types.hpp"
#include <string>
#include <vector>

namespace passive_kv
{
    class Config
    {
    public:
        static Config &getInstance()
        {
            static Config instance;
            return instance;
        }

        // Local endpoint of the process being started
        std::string getHost() const { return _host; }
        void setHost(const std::string &host) { _host = host; }

        Port getPort() const { return _port; }
        void setPort(Port port) { _port = port; }

        std::string getRegistryHost() const { return _registry_host; }
        void setRegistryHost(const std::string &host) { _registry_host = host; }

        Port getRegistryPort() const { return _registry_port; }
        void setRegistryPort(Port port) { _registry_port = port; }

        std::string getReplicaNamePrefix() const { return _replica_name_prefix; }
        void setReplicaNamePrefix(const std::string &prefix) { _replica_name_prefix = prefix; }

        // Replica topology
        ReplicaId getReplicaId() const { return _replica_id; }
        void setReplicaId(ReplicaId id) { _replica_id = id; }

        bool getStartAsPrimary() const { return _start_as_primary; }
        void setStartAsPrimary(bool primary) { _start_as_primary = primary; }

        // Dispatcher topology
        ReplicaId getPrimaryId() const { return _primary_id; }
        void setPrimaryId(ReplicaId id) { _primary_id = id; }

        std::vector<ReplicaId> getInitialBackups() const { return _initial_backups; }
        void setInitialBackups(const std::vector<ReplicaId> &backups) { _initial_backups = backups; }

        std::string getDispatcherHost() const { return _dispatcher_host; }
        void setDispatcherHost(const std::string &host) { _dispatcher_host = host; }

        Port getDispatcherPort() const { return _dispatcher_port; }
        void setDispatcherPort(Port port) { _dispatcher_port = port; }

        std::chrono::milliseconds getDiscoveryInterval() const { return _discovery_interval; }
        void setDiscoveryInterval(std::chrono::milliseconds interval) { _discovery_interval = interval; }

        std::chrono::milliseconds getRpcTimeout() const { return _rpc_timeout; }
        void setRpcTimeout(std::chrono::milliseconds timeout) { _rpc_timeout = timeout; }

        // Client puts, gets and promotions fan out into nested RPCs, so they wait longer
        std::chrono::milliseconds getClientOpTimeout() const { return _client_op_timeout; }
        void setClientOpTimeout(std::chrono::milliseconds timeout) { _client_op_timeout = timeout; }

        std::string getLogLevel() const { return _log_level; }
        void setLogLevel(const std::string &level) { _log_level = level; }

        bool loadFromFile(const std::string &filename);
        bool saveToFile(const std::string &filename) const;

        // Applies a single "key=value" setting, as found in a config file or on the command line
        bool applyOverride(const std::string &line);

        void resetToDefaults();

    private:
        Config() = default;

        bool applySetting(const std::string &key, const std::string &value);

        std::string _host = "127.0.0.1";
        Port _port = 0;

        std::string _registry_host = "127.0.0.1";
        Port _registry_port = 1099;
        std::string _replica_name_prefix = "replica";

        ReplicaId _replica_id = 1;
        bool _start_as_primary = false;

        ReplicaId _primary_id = 1;
        std::vector<ReplicaId> _initial_backups;

        std::string _dispatcher_host = "127.0.0.1";
        Port _dispatcher_port = 50051;

        std::chrono::milliseconds _discovery_interval{5000};
        std::chrono::milliseconds _rpc_timeout{3000};
        std::chrono::milliseconds _client_op_timeout{30000};

        std::string _log_level = "info";
    };
} // passive_kv

#endif // __CONFIG_HPP__
