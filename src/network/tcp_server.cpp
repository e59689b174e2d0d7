#include "tcp_server.hpp"
#include "../common/logger.hpp"
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

#define INVALID_SOCKET_VALUE -1
#define SOCKET_ERROR_VALUE -1

namespace passive_kv
{
    TcpServer::TcpServer(Port port)
        : TcpServer(port, "0.0.0.0") {}

    TcpServer::TcpServer(Port port, const std::string &bind_address)
        : _port(port), _bind_address(bind_address), _server_socket(INVALID_SOCKET_VALUE),
          _running(false), _should_stop(false), _max_connections(100),
          _receive_timeout(std::chrono::milliseconds(30000))
    {
    }

    TcpServer::~TcpServer()
    {
        stop();
    }

    Status TcpServer::start()
    {
        if (_running)
        {
            return Status::OK;
        }

        const auto init_status = initializeSocket();
        if (init_status != Status::OK)
        {
            return init_status;
        }

        _should_stop = false;
        _running = true;

        _accept_thread = std::make_unique<std::thread>(&TcpServer::acceptLoop, this);

        LOG_INFO("TCP server started on %s:%u", _bind_address.c_str(), static_cast<unsigned>(_port.load()));
        return Status::OK;
    }

    void TcpServer::stop()
    {
        if (!_running)
        {
            return;
        }

        _should_stop = true;
        _running = false;

        // Unblocks accept() on the listening socket
        ::shutdown(_server_socket, SHUT_RDWR);

        if (_accept_thread && _accept_thread->joinable())
        {
            _accept_thread->join();
        }
        _accept_thread.reset();

        socket_utils::closeSocket(_server_socket);
        _server_socket = INVALID_SOCKET_VALUE;

        std::unordered_map<std::uint64_t, std::thread> workers;
        {
            const std::lock_guard<std::mutex> lock(_connections_mutex);
            for (auto &[id, connection] : _active_connections)
            {
                connection->shutdown();
            }
            workers.swap(_worker_threads);
        }

        for (auto &[id, thread] : workers)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }

        {
            const std::lock_guard<std::mutex> lock(_connections_mutex);
            _active_connections.clear();
            _finished_workers.clear();
        }

        LOG_INFO("TCP server on port %u stopped", static_cast<unsigned>(_port.load()));
    }

    std::size_t TcpServer::getConnectionCount() const
    {
        const std::lock_guard<std::mutex> lock(_connections_mutex);
        return _active_connections.size();
    }

    Status TcpServer::initializeSocket()
    {
        _server_socket = socket(AF_INET, SOCK_STREAM, 0);
        if (_server_socket == INVALID_SOCKET_VALUE)
        {
            LOG_ERROR("Failed to create socket: %s", socket_utils::getLastSocketError().c_str());
            return Status::NETWORK_ERROR;
        }

        const auto options_status = setSocketOptions(_server_socket);
        if (options_status != Status::OK)
        {
            socket_utils::closeSocket(_server_socket);
            _server_socket = INVALID_SOCKET_VALUE;
            return options_status;
        }

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(_port);

        if (_bind_address == "0.0.0.0")
        {
            addr.sin_addr.s_addr = INADDR_ANY;
        }
        else
        {
            if (inet_pton(AF_INET, _bind_address.c_str(), &addr.sin_addr) <= 0)
            {
                LOG_ERROR("Invalid bind address: %s", _bind_address.c_str());
                socket_utils::closeSocket(_server_socket);
                _server_socket = INVALID_SOCKET_VALUE;
                return Status::INVALID_REQUEST;
            }
        }

        if (bind(_server_socket, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == SOCKET_ERROR_VALUE)
        {
            LOG_ERROR("Failed to bind %s:%u: %s", _bind_address.c_str(), static_cast<unsigned>(_port.load()),
                      socket_utils::getLastSocketError().c_str());
            socket_utils::closeSocket(_server_socket);
            _server_socket = INVALID_SOCKET_VALUE;
            return Status::NETWORK_ERROR;
        }

        if (listen(_server_socket, SOMAXCONN) == SOCKET_ERROR_VALUE)
        {
            LOG_ERROR("Failed to listen on socket: %s", socket_utils::getLastSocketError().c_str());
            socket_utils::closeSocket(_server_socket);
            _server_socket = INVALID_SOCKET_VALUE;
            return Status::NETWORK_ERROR;
        }

        struct sockaddr_in bound{};
        socklen_t bound_len = sizeof(bound);
        if (getsockname(_server_socket, reinterpret_cast<struct sockaddr *>(&bound), &bound_len) == 0)
        {
            _port = ntohs(bound.sin_port);
        }

        return Status::OK;
    }

    void TcpServer::acceptLoop()
    {
        LOG_DEBUG("Accept loop started");

        while (!_should_stop)
        {
            struct sockaddr_in client_addr{};
            socklen_t client_addr_len = sizeof(client_addr);

            const auto client_socket = accept(_server_socket,
                                              reinterpret_cast<struct sockaddr *>(&client_addr),
                                              &client_addr_len);

            if (client_socket == INVALID_SOCKET_VALUE)
            {
                if (_should_stop)
                {
                    break;
                }

                if (errno == EINTR || errno == ECONNABORTED)
                {
                    continue;
                }

                if (errno == EBADF || errno == EINVAL)
                {
                    break; // Server socket closed
                }

                LOG_WARN("Accept failed: %s", socket_utils::getLastSocketError().c_str());
                continue;
            }

            cleanupConnections();

            if (getConnectionCount() >= _max_connections)
            {
                LOG_WARN("Connection limit reached, rejecting new connection");
                socket_utils::closeSocket(client_socket);
                continue;
            }

            char client_ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, INET_ADDRSTRLEN);
            const auto remote_address = std::string(client_ip) + ":" + std::to_string(ntohs(client_addr.sin_port));

            auto connection = std::make_shared<Connection>(client_socket, remote_address);
            const auto connection_id = connection->getConnectionId();

            if (connection->setReceiveTimeout(_receive_timeout) != Status::OK)
            {
                LOG_WARN("Connection %lu has no receive timeout", connection_id);
            }

            LOG_DEBUG("New connection from %s (ID: %lu)", remote_address.c_str(), connection_id);

            // The worker reports completion under the same lock, so it is always found in the map
            const std::lock_guard<std::mutex> lock(_connections_mutex);
            _active_connections[connection_id] = connection;
            _worker_threads.emplace(connection_id, std::thread([this, connection]()
                                                               { handleConnection(connection); }));
        }

        LOG_DEBUG("Accept loop finished");
    }

    void TcpServer::handleConnection(const std::shared_ptr<Connection> &connection)
    {
        const auto connection_id = connection->getConnectionId();
        const auto &remote_address = connection->getRemoteAddress();

        LOG_DEBUG("Handling connection %lu from %s", connection_id, remote_address.c_str());

        while (connection->isConnected() && !_should_stop)
        {
            auto message_result = connection->receiveMessage();

            if (!message_result.ok())
            {
                if (message_result.status() == Status::TIMEOUT && connection->isConnected())
                {
                    continue; // Idle, keep waiting
                }
                LOG_DEBUG("Failed to receive message from connection %lu: %s",
                          connection_id, statusToString(message_result.status()));
                break;
            }

            const auto &message = message_result.value();
            LOG_DEBUG("Received %s message from connection %lu",
                      messageTypeToString(message->getType()).c_str(), connection_id);

            processMessage(*message, *connection);
        }

        connection->close();
        LOG_DEBUG("Connection %lu from %s closed", connection_id, remote_address.c_str());

        const std::lock_guard<std::mutex> lock(_connections_mutex);
        _active_connections.erase(connection_id);
        _finished_workers.push_back(connection_id);
    }

    void TcpServer::processMessage(const Message &request, Connection &connection)
    {
        std::unique_ptr<Message> response;

        try
        {
            if (_message_handler)
            {
                response = _message_handler(request, connection);
            }
            else
            {
                LOG_WARN("No handler installed for %s", messageTypeToString(request.getType()).c_str());
                response = std::make_unique<ErrorResponseMessage>(
                    request.getMessageId(), Status::INVALID_REQUEST, "Unsupported message type");
            }
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("Exception processing %s: %s", messageTypeToString(request.getType()).c_str(), e.what());
            response = std::make_unique<ErrorResponseMessage>(
                request.getMessageId(), Status::INTERNAL_ERROR, e.what());
        }

        if (response)
        {
            const auto send_status = connection.sendMessage(*response);
            if (send_status != Status::OK)
            {
                LOG_WARN("Failed to send response to connection %lu", connection.getConnectionId());
            }
        }
    }

    void TcpServer::cleanupConnections()
    {
        std::vector<std::thread> finished;
        {
            const std::lock_guard<std::mutex> lock(_connections_mutex);
            for (const auto id : _finished_workers)
            {
                const auto it = _worker_threads.find(id);
                if (it != _worker_threads.end())
                {
                    finished.push_back(std::move(it->second));
                    _worker_threads.erase(it);
                }
            }
            _finished_workers.clear();
        }

        for (auto &thread : finished)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }
    }

    Status TcpServer::setSocketOptions(socket_t socket)
    {
        int reuse = 1;
        if (setsockopt(socket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == SOCKET_ERROR_VALUE)
        {
            LOG_WARN("Failed to set SO_REUSEADDR: %s", socket_utils::getLastSocketError().c_str());
        }

        return Status::OK;
    }
} // passive_kv
