#include "connection.hpp"
#include "../common/logger.hpp"
#include <cstring>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

#define INVALID_SOCKET_VALUE -1
#define SOCKET_ERROR_VALUE -1

namespace passive_kv
{
    std::atomic<std::uint64_t> Connection::_next_connection_id{1};

    Connection::Connection(socket_t socket, const std::string &remote_address)
        : _socket(socket), _remote_address(remote_address),
          _connection_id(_next_connection_id.fetch_add(1, std::memory_order_relaxed)),
          _connected_at(std::chrono::system_clock::now()),
          _connected(true)
    {
    }

    Connection::~Connection()
    {
        close();
    }

    Status Connection::sendMessage(const Message &message)
    {
        const std::lock_guard<std::mutex> lock(_send_mutex);

        if (!_connected)
        {
            return Status::NETWORK_ERROR;
        }

        const auto serialized_result = message.serialize();
        if (!serialized_result.ok())
        {
            LOG_ERROR("Failed to serialize %s", messageTypeToString(message.getType()).c_str());
            return serialized_result.status();
        }

        return sendBytes(serialized_result.value());
    }

    Result<std::unique_ptr<Message>> Connection::receiveMessage()
    {
        if (!_connected)
        {
            return Result<std::unique_ptr<Message>>(Status::NETWORK_ERROR);
        }

        auto header_result = receiveExactBytes(MessageHeader::HEADER_SIZE);
        if (!header_result.ok())
        {
            return Result<std::unique_ptr<Message>>(header_result.status());
        }

        const auto &header_data = header_result.value();

        std::uint32_t payload_size;
        std::memcpy(&payload_size, header_data.data() + MessageHeader::PAYLOAD_SIZE_OFFSET, sizeof(payload_size));

        if (payload_size > MessageHeader::MAX_PAYLOAD_SIZE)
        {
            LOG_ERROR("Payload size too large: %u bytes", payload_size);
            _connected = false;
            return Result<std::unique_ptr<Message>>(Status::INVALID_REQUEST);
        }

        std::vector<std::uint8_t> full_message = header_data;
        if (payload_size > 0)
        {
            auto payload_result = receiveExactBytes(payload_size);
            if (!payload_result.ok())
            {
                // A partial frame leaves the stream unusable
                _connected = false;
                return Result<std::unique_ptr<Message>>(payload_result.status());
            }

            const auto &payload_data = payload_result.value();
            full_message.insert(full_message.end(), payload_data.begin(), payload_data.end());
        }

        return Message::fromBytes(full_message);
    }

    Status Connection::setReceiveTimeout(std::chrono::milliseconds timeout)
    {
        return socket_utils::setReceiveTimeout(_socket, timeout);
    }

    void Connection::shutdown()
    {
        const std::lock_guard<std::mutex> lock(_close_mutex);
        if (_socket != INVALID_SOCKET_VALUE)
        {
            ::shutdown(_socket, SHUT_RDWR);
        }
    }

    void Connection::close()
    {
        const std::lock_guard<std::mutex> lock(_close_mutex);
        if (_socket == INVALID_SOCKET_VALUE)
        {
            return;
        }

        _connected = false;
        socket_utils::closeSocket(_socket);
        _socket = INVALID_SOCKET_VALUE;
        LOG_DEBUG("Connection %lu closed", _connection_id);
    }

    Status Connection::sendBytes(const std::vector<std::uint8_t> &data)
    {
        std::size_t total_sent = 0;
        const auto *buffer = reinterpret_cast<const char *>(data.data());

        while (total_sent < data.size())
        {
            const auto bytes_to_send = data.size() - total_sent;
            const auto bytes_sent = send(_socket, buffer + total_sent, bytes_to_send, MSG_NOSIGNAL);

            if (bytes_sent == SOCKET_ERROR_VALUE)
            {
                if (errno == EINTR)
                {
                    continue; // Try again
                }
                LOG_DEBUG("Send to %s failed: %s", _remote_address.c_str(),
                          socket_utils::getLastSocketError().c_str());
                _connected = false;
                return Status::NETWORK_ERROR;
            }

            if (bytes_sent == 0)
            {
                LOG_DEBUG("Connection closed by peer during send");
                _connected = false;
                return Status::NETWORK_ERROR;
            }

            total_sent += static_cast<std::size_t>(bytes_sent);
        }

        return Status::OK;
    }

    Result<std::vector<std::uint8_t>> Connection::receiveBytes(std::size_t size)
    {
        std::vector<std::uint8_t> buffer(size);
        const auto bytes_received = recv(_socket, reinterpret_cast<char *>(buffer.data()), size, 0);

        if (bytes_received == SOCKET_ERROR_VALUE)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return Result<std::vector<std::uint8_t>>(Status::TIMEOUT);
            }
            if (errno == EINTR)
            {
                buffer.clear();
                return Result<std::vector<std::uint8_t>>(std::move(buffer));
            }
            LOG_DEBUG("Receive from %s failed: %s", _remote_address.c_str(),
                      socket_utils::getLastSocketError().c_str());
            _connected = false;
            return Result<std::vector<std::uint8_t>>(Status::NETWORK_ERROR);
        }

        if (bytes_received == 0)
        {
            LOG_DEBUG("Connection closed by peer during receive");
            _connected = false;
            return Result<std::vector<std::uint8_t>>(Status::NETWORK_ERROR);
        }

        buffer.resize(static_cast<std::size_t>(bytes_received));
        return Result<std::vector<std::uint8_t>>(std::move(buffer));
    }

    Result<std::vector<std::uint8_t>> Connection::receiveExactBytes(std::size_t size)
    {
        std::vector<std::uint8_t> buffer;
        buffer.reserve(size);

        while (buffer.size() < size)
        {
            const auto remaining = size - buffer.size();
            auto chunk_result = receiveBytes(remaining);

            if (!chunk_result.ok())
            {
                if (chunk_result.status() == Status::TIMEOUT && !buffer.empty())
                {
                    // Stalled mid-frame
                    _connected = false;
                }
                return chunk_result;
            }

            const auto &chunk = chunk_result.value();
            buffer.insert(buffer.end(), chunk.begin(), chunk.end());
        }

        return Result<std::vector<std::uint8_t>>(std::move(buffer));
    }

    namespace socket_utils
    {
        std::string getLastSocketError()
        {
            return std::strerror(errno);
        }

        bool isSocketValid(socket_t socket)
        {
            return socket != INVALID_SOCKET_VALUE;
        }

        Status closeSocket(socket_t socket)
        {
            if (socket != INVALID_SOCKET_VALUE)
            {
                if (::close(socket) == SOCKET_ERROR_VALUE)
                {
                    LOG_WARN("Failed to close socket: %s", getLastSocketError().c_str());
                    return Status::NETWORK_ERROR;
                }
            }
            return Status::OK;
        }

        Status setNonBlocking(socket_t socket, bool non_blocking)
        {
            const auto flags = fcntl(socket, F_GETFL, 0);
            if (flags == -1)
            {
                return Status::NETWORK_ERROR;
            }

            const auto new_flags = non_blocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            if (fcntl(socket, F_SETFL, new_flags) == -1)
            {
                return Status::NETWORK_ERROR;
            }

            return Status::OK;
        }

        Status setReceiveTimeout(socket_t socket, std::chrono::milliseconds timeout)
        {
            const auto timeout_ms = timeout.count();

            struct timeval tv{};
            tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);

            if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == SOCKET_ERROR_VALUE)
            {
                LOG_WARN("Failed to set receive timeout: %s", getLastSocketError().c_str());
                return Status::NETWORK_ERROR;
            }

            return Status::OK;
        }

        Result<socket_t> connectTo(const std::string &host, Port port, std::chrono::milliseconds timeout)
        {
            struct sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);

            if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0)
            {
                struct addrinfo hints{};
                hints.ai_family = AF_INET;
                hints.ai_socktype = SOCK_STREAM;

                struct addrinfo *resolved = nullptr;
                if (getaddrinfo(host.c_str(), nullptr, &hints, &resolved) != 0 || !resolved)
                {
                    LOG_DEBUG("Failed to resolve hostname: %s", host.c_str());
                    return Result<socket_t>(Status::NETWORK_ERROR);
                }

                addr.sin_addr = reinterpret_cast<struct sockaddr_in *>(resolved->ai_addr)->sin_addr;
                freeaddrinfo(resolved);
            }

            const socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
            if (sock == INVALID_SOCKET_VALUE)
            {
                LOG_ERROR("Failed to create socket: %s", getLastSocketError().c_str());
                return Result<socket_t>(Status::NETWORK_ERROR);
            }

            if (setNonBlocking(sock, true) != Status::OK)
            {
                closeSocket(sock);
                return Result<socket_t>(Status::NETWORK_ERROR);
            }

            if (::connect(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == SOCKET_ERROR_VALUE)
            {
                if (errno != EINPROGRESS)
                {
                    LOG_DEBUG("Connect to %s:%u failed: %s", host.c_str(), port, getLastSocketError().c_str());
                    closeSocket(sock);
                    return Result<socket_t>(Status::NETWORK_ERROR);
                }

                struct pollfd pfd{};
                pfd.fd = sock;
                pfd.events = POLLOUT;

                const auto ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
                if (ready == 0)
                {
                    LOG_DEBUG("Connect to %s:%u timed out", host.c_str(), port);
                    closeSocket(sock);
                    return Result<socket_t>(Status::TIMEOUT);
                }

                int error = 0;
                socklen_t error_len = sizeof(error);
                if (ready < 0 || getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &error_len) == SOCKET_ERROR_VALUE || error != 0)
                {
                    LOG_DEBUG("Connect to %s:%u failed: %s", host.c_str(), port,
                              std::strerror(error != 0 ? error : errno));
                    closeSocket(sock);
                    return Result<socket_t>(Status::NETWORK_ERROR);
                }
            }

            if (setNonBlocking(sock, false) != Status::OK)
            {
                closeSocket(sock);
                return Result<socket_t>(Status::NETWORK_ERROR);
            }

            return Result<socket_t>(sock);
        }
    } // namespace socket_utils
} // passive_kv
