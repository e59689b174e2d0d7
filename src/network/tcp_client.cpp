#include "tcp_client.hpp"
#include "../common/logger.hpp"

namespace passive_kv
{
    TcpClient::TcpClient() : TcpClient(std::chrono::milliseconds(3000)) {}

    TcpClient::TcpClient(std::chrono::milliseconds connect_timeout)
        : _port(0), _default_timeout(std::chrono::milliseconds(3000)), _connect_timeout(connect_timeout) {}

    TcpClient::~TcpClient()
    {
        disconnect();
    }

    Status TcpClient::connect(const std::string &host, Port port)
    {
        const std::lock_guard<std::mutex> lock(_request_mutex);

        dropConnection();

        _host = host;
        _port = port;

        const auto status = openConnection(host, port);
        if (status != Status::OK)
        {
            return status;
        }

        LOG_DEBUG("Connected to %s:%u", host.c_str(), static_cast<unsigned>(port));
        return Status::OK;
    }

    void TcpClient::disconnect()
    {
        const std::lock_guard<std::mutex> lock(_request_mutex);
        if (_connection)
        {
            dropConnection();
            LOG_DEBUG("Disconnected from %s:%u", _host.c_str(), static_cast<unsigned>(_port));
        }
    }

    bool TcpClient::isConnected() const
    {
        const std::lock_guard<std::mutex> lock(_request_mutex);
        return _connection && _connection->isConnected();
    }

    Result<std::unique_ptr<Message>> TcpClient::sendRequest(const Message &request)
    {
        return sendRequest(request, _default_timeout);
    }

    Result<std::unique_ptr<Message>> TcpClient::sendRequest(const Message &request,
                                                            std::chrono::milliseconds timeout)
    {
        const std::lock_guard<std::mutex> lock(_request_mutex);

        if (!_connection || !_connection->isConnected())
        {
            if (_host.empty())
            {
                return Result<std::unique_ptr<Message>>(Status::NETWORK_ERROR);
            }

            const auto reconnect_status = openConnection(_host, _port);
            if (reconnect_status != Status::OK)
            {
                return Result<std::unique_ptr<Message>>(reconnect_status);
            }
        }

        if (_connection->setReceiveTimeout(timeout) != Status::OK)
        {
            dropConnection();
            return Result<std::unique_ptr<Message>>(Status::NETWORK_ERROR);
        }

        const auto send_status = _connection->sendMessage(request);
        if (send_status != Status::OK)
        {
            dropConnection();
            return Result<std::unique_ptr<Message>>(send_status);
        }

        auto response_result = _connection->receiveMessage();
        if (!response_result.ok())
        {
            LOG_DEBUG("No reply to %s from %s:%u: %s", messageTypeToString(request.getType()).c_str(),
                      _host.c_str(), static_cast<unsigned>(_port), statusToString(response_result.status()));
            dropConnection();
            return response_result;
        }

        if (response_result.value()->getMessageId() != request.getMessageId())
        {
            LOG_WARN("Reply id %u does not match request id %u", response_result.value()->getMessageId(),
                     request.getMessageId());
            dropConnection();
            return Result<std::unique_ptr<Message>>(Status::INTERNAL_ERROR);
        }

        return response_result;
    }

    Result<bool> TcpClient::put(const Key &key, const Value &value)
    {
        PutRequestMessage request(key, value);

        const auto response_result = sendRequest(request);
        if (!response_result.ok())
        {
            return Result<bool>(response_result.status());
        }

        const auto &response = *response_result.value();
        const auto type_status = expectResponse(response, MessageType::PUT_RESPONSE);
        if (type_status != Status::OK)
        {
            return Result<bool>(type_status);
        }

        const auto &put_response = static_cast<const PutResponseMessage &>(response);
        if (put_response.getStatus() != Status::OK)
        {
            return Result<bool>(put_response.getStatus());
        }

        return Result<bool>(put_response.isAccepted());
    }

    Result<std::optional<Value>> TcpClient::get(const Key &key)
    {
        GetRequestMessage request(key);

        const auto response_result = sendRequest(request);
        if (!response_result.ok())
        {
            return Result<std::optional<Value>>(response_result.status());
        }

        const auto &response = *response_result.value();
        const auto type_status = expectResponse(response, MessageType::GET_RESPONSE);
        if (type_status != Status::OK)
        {
            return Result<std::optional<Value>>(type_status);
        }

        const auto &get_response = static_cast<const GetResponseMessage &>(response);
        if (get_response.getStatus() != Status::OK)
        {
            return Result<std::optional<Value>>(get_response.getStatus());
        }

        return Result<std::optional<Value>>(get_response.getValue());
    }

    Status TcpClient::ping()
    {
        PingMessage request("client");

        const auto response_result = sendRequest(request);
        if (!response_result.ok())
        {
            return response_result.status();
        }

        return expectResponse(*response_result.value(), MessageType::PING_RESPONSE);
    }

    // Single attempt; failover decisions belong to the caller
    Status TcpClient::openConnection(const std::string &host, Port port)
    {
        auto socket_result = socket_utils::connectTo(host, port, _connect_timeout);
        if (!socket_result.ok())
        {
            LOG_DEBUG("Failed to connect to %s:%u: %s", host.c_str(), static_cast<unsigned>(port),
                      statusToString(socket_result.status()));
            return Status::NETWORK_ERROR;
        }

        _connection = std::make_unique<Connection>(socket_result.value(), host + ":" + std::to_string(port));
        return Status::OK;
    }

    void TcpClient::dropConnection()
    {
        if (_connection)
        {
            _connection->close();
            _connection.reset();
        }
    }

    Status expectResponse(const Message &response, MessageType expected)
    {
        if (response.getType() == expected)
        {
            return Status::OK;
        }

        if (response.getType() == MessageType::ERROR_RESPONSE)
        {
            const auto &error = static_cast<const ErrorResponseMessage &>(response);
            LOG_DEBUG("Remote error: %s (%s)", error.getErrorMessage().c_str(), statusToString(error.getStatus()));
            return error.getStatus() == Status::OK ? Status::INTERNAL_ERROR : error.getStatus();
        }

        LOG_WARN("Expected %s but received %s", messageTypeToString(expected).c_str(),
                 messageTypeToString(response.getType()).c_str());
        return Status::INTERNAL_ERROR;
    }
} // passive_kv
