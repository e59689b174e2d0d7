#ifndef __REMOTE_REGISTRY_HPP__
#define __REMOTE_REGISTRY_HPP__

#include "replica_registry.hpp"
#include "../network/tcp_client.hpp"
#include <chrono>

namespace passive_kv
{
    // Client for a RegistryServer. lookup() hands out RemoteReplica handles.
    class RemoteRegistry : public ReplicaRegistry
    {
    public:
        RemoteRegistry(std::string host, Port port,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000),
                       std::chrono::milliseconds client_op_timeout = std::chrono::milliseconds(30000));

        Status publish(const std::string &name, const std::string &address, Port port) override;
        Result<ReplicaHandlePtr> lookup(const std::string &name) override;
        Result<std::vector<std::string>> listNames() override;

        const std::string &getHost() const noexcept { return _host; }
        Port getPort() const noexcept { return _port; }

    private:
        std::string _host;
        Port _port;
        std::chrono::milliseconds _timeout;
        std::chrono::milliseconds _client_op_timeout;
        TcpClient _client;

        Result<std::unique_ptr<Message>> request(const Message &message, MessageType expected);
    };
} // namespace passive_kv

#endif // __REMOTE_REGISTRY_HPP__
