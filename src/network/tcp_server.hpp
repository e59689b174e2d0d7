#ifndef __TCP_SERVER_HPP__
#define __TCP_SERVER_HPP__

#include "../common/types.hpp"
#include "connection.hpp"
#include "message.hpp"
#include <atomic>
#include <mutex>
#include <vector>
#include <memory>
#include <thread>
#include <functional>
#include <unordered_map>

namespace passive_kv
{
    // Returns the response for `request`; nullptr means no reply is sent
    using MessageHandler = std::function<std::unique_ptr<Message>(const Message &, const Connection &)>;

    class TcpServer
    {
    public:
        explicit TcpServer(Port port);
        TcpServer(Port port, const std::string &bind_address);
        ~TcpServer();

        TcpServer(const TcpServer &) = delete;
        TcpServer &operator=(const TcpServer &) = delete;

        Status start();
        void stop();
        bool isRunning() const noexcept { return _running; }

        // Must be set before start()
        void setMessageHandler(MessageHandler handler) { _message_handler = std::move(handler); }

        // The bound port; resolved after start() when constructed with port 0
        Port getPort() const noexcept { return _port; }
        std::size_t getConnectionCount() const;

    private:
        std::atomic<Port> _port;
        std::string _bind_address;
        socket_t _server_socket;
        std::atomic<bool> _running;
        std::atomic<bool> _should_stop;

        std::unique_ptr<std::thread> _accept_thread;
        mutable std::mutex _connections_mutex;

        std::unordered_map<std::uint64_t, std::shared_ptr<Connection>> _active_connections;
        std::unordered_map<std::uint64_t, std::thread> _worker_threads;
        std::vector<std::uint64_t> _finished_workers;
        std::size_t _max_connections;
        std::chrono::milliseconds _receive_timeout;

        MessageHandler _message_handler;

        Status initializeSocket();
        void acceptLoop();
        void handleConnection(const std::shared_ptr<Connection> &connection);
        void processMessage(const Message &request, Connection &connection);
        void cleanupConnections();

        Status setSocketOptions(socket_t socket);
    };
} // passive_kv

#endif // __TCP_SERVER_HPP__
