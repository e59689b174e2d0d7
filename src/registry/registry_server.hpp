#ifndef __REGISTRY_SERVER_HPP__
#define __REGISTRY_SERVER_HPP__

#include "../cluster/node_info.hpp"
#include "../network/tcp_server.hpp"
#include <memory>

namespace passive_kv
{
    // Serves bind/lookup/list requests from a NodeRegistry
    class RegistryServer
    {
    public:
        explicit RegistryServer(Port port, const std::string &bind_address = "0.0.0.0");
        ~RegistryServer();

        RegistryServer(const RegistryServer &) = delete;
        RegistryServer &operator=(const RegistryServer &) = delete;

        Status start();
        void stop();

        [[nodiscard]] Port getPort() const noexcept { return _server.getPort(); }
        [[nodiscard]] const NodeRegistry &getNodes() const noexcept { return _nodes; }

        std::unique_ptr<Message> handleMessage(const Message &request);

    private:
        NodeRegistry _nodes;
        TcpServer _server;
    };
} // namespace passive_kv

#endif // __REGISTRY_SERVER_HPP__
