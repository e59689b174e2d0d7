#ifndef __CONNECTION_HPP__
#define __CONNECTION_HPP__

#include "../common/types.hpp"
#include "message.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using socket_t = int;

namespace passive_kv
{
    // One framed-message stream over a connected socket. Owns the socket.
    class Connection
    {
    public:
        Connection(socket_t socket, const std::string &remote_address);
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        socket_t getSocket() const noexcept { return _socket; }
        const std::string &getRemoteAddress() const noexcept { return _remote_address; }
        std::uint64_t getConnectionId() const noexcept { return _connection_id; }
        Timestamp getConnectedAt() const noexcept { return _connected_at; }

        Status sendMessage(const Message &message);

        // TIMEOUT when no complete frame arrived within the receive timeout
        Result<std::unique_ptr<Message>> receiveMessage();

        Status setReceiveTimeout(std::chrono::milliseconds timeout);

        // Wakes up any thread blocked in receive without releasing the socket
        void shutdown();
        void close();

        bool isConnected() const noexcept { return _connected; }

    private:
        socket_t _socket;
        std::string _remote_address;
        std::uint64_t _connection_id;
        Timestamp _connected_at;
        std::atomic<bool> _connected;
        std::mutex _close_mutex;
        mutable std::mutex _send_mutex;

        static std::atomic<std::uint64_t> _next_connection_id;

        Status sendBytes(const std::vector<std::uint8_t> &data);
        Result<std::vector<std::uint8_t>> receiveBytes(std::size_t size);
        Result<std::vector<std::uint8_t>> receiveExactBytes(std::size_t size);
    };

    namespace socket_utils
    {
        std::string getLastSocketError();
        bool isSocketValid(socket_t socket);
        Status closeSocket(socket_t socket);
        Status setNonBlocking(socket_t socket, bool non_blocking);
        Status setReceiveTimeout(socket_t socket, std::chrono::milliseconds timeout);

        // Connects to host:port (dotted quad or resolvable name) within `timeout`
        Result<socket_t> connectTo(const std::string &host, Port port, std::chrono::milliseconds timeout);
    }
} // passive_kv

#endif // __CONNECTION_HPP__
