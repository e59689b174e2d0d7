#ifndef __TCP_CLIENT_HPP__
#define __TCP_CLIENT_HPP__

#include "../common/types.hpp"
#include "connection.hpp"
#include "message.hpp"
#include <memory>
#include <mutex>
#include <optional>

namespace passive_kv
{
    // Synchronous request/response client. One request in flight at a time;
    // any transport failure drops the connection so the next call reconnects.
    class TcpClient
    {
    public:
        TcpClient();
        explicit TcpClient(std::chrono::milliseconds connect_timeout);
        ~TcpClient();

        // Non-copyable
        TcpClient(const TcpClient &) = delete;
        TcpClient &operator=(const TcpClient &) = delete;

        // Connection management
        Status connect(const std::string &host, Port port);
        void disconnect();
        bool isConnected() const;

        // Synchronous operations
        Result<std::unique_ptr<Message>> sendRequest(const Message &request);
        Result<std::unique_ptr<Message>> sendRequest(const Message &request,
                                                     std::chrono::milliseconds timeout);

        // Client operations against a dispatcher or a replica
        Result<bool> put(const Key &key, const Value &value);
        Result<std::optional<Value>> get(const Key &key);
        Status ping();

        // Configuration
        void setDefaultTimeout(std::chrono::milliseconds timeout) noexcept { _default_timeout = timeout; }

        // Connection info
        const std::string &getHost() const noexcept { return _host; }
        Port getPort() const noexcept { return _port; }
        std::chrono::milliseconds getDefaultTimeout() const noexcept { return _default_timeout; }

    private:
        std::unique_ptr<Connection> _connection;
        std::string _host;
        Port _port;
        mutable std::mutex _request_mutex;

        std::chrono::milliseconds _default_timeout;
        std::chrono::milliseconds _connect_timeout;

        Status openConnection(const std::string &host, Port port);
        void dropConnection();
    };

    // Validates the type of a reply. An ERROR_RESPONSE yields the status it carries.
    Status expectResponse(const Message &response, MessageType expected);
} // passive_kv

#endif // __TCP_CLIENT_HPP__
