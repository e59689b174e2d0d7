#include "remote_replica.hpp"
#include "../network/tcp_client.hpp"
#include "../common/logger.hpp"

namespace passive_kv
{
    RemoteReplica::RemoteReplica(std::string name, std::string host, Port port,
                                 std::chrono::milliseconds timeout, std::chrono::milliseconds client_op_timeout)
        : _name(std::move(name)), _host(std::move(host)), _port(port), _timeout(timeout),
          _client_op_timeout(client_op_timeout)
    {
    }

    Result<std::unique_ptr<Message>> RemoteReplica::call(const Message &request, MessageType expected,
                                                         std::chrono::milliseconds timeout)
    {
        TcpClient client(_timeout);
        client.setDefaultTimeout(timeout);

        const auto connect_status = client.connect(_host, _port);
        if (connect_status != Status::OK)
        {
            LOG_DEBUG("%s unreachable at %s:%u", _name.c_str(), _host.c_str(), static_cast<unsigned>(_port));
            return Result<std::unique_ptr<Message>>(connect_status);
        }

        auto response_result = client.sendRequest(request);
        if (!response_result.ok())
        {
            return response_result;
        }

        const auto type_status = expectResponse(*response_result.value(), expected);
        if (type_status != Status::OK)
        {
            return Result<std::unique_ptr<Message>>(type_status);
        }

        return response_result;
    }

    Result<bool> RemoteReplica::handleClientPut(const Key &key, const Value &value)
    {
        const auto response_result =
            call(PutRequestMessage(key, value), MessageType::PUT_RESPONSE, _client_op_timeout);
        if (!response_result.ok())
        {
            return Result<bool>(response_result.status());
        }

        const auto &response = static_cast<const PutResponseMessage &>(*response_result.value());
        if (response.getStatus() != Status::OK)
        {
            return Result<bool>(response.getStatus());
        }
        return Result<bool>(response.isAccepted());
    }

    Result<std::optional<Value>> RemoteReplica::handleClientGet(const Key &key)
    {
        const auto response_result =
            call(GetRequestMessage(key), MessageType::GET_RESPONSE, _client_op_timeout);
        if (!response_result.ok())
        {
            return Result<std::optional<Value>>(response_result.status());
        }

        const auto &response = static_cast<const GetResponseMessage &>(*response_result.value());
        if (response.getStatus() != Status::OK)
        {
            return Result<std::optional<Value>>(response.getStatus());
        }
        return Result<std::optional<Value>>(response.getValue());
    }

    Result<Snapshot> RemoteReplica::getState()
    {
        const auto response_result =
            call(GetStateRequestMessage(), MessageType::GET_STATE_RESPONSE, _timeout);
        if (!response_result.ok())
        {
            return Result<Snapshot>(response_result.status());
        }

        const auto &response = static_cast<const GetStateResponseMessage &>(*response_result.value());
        if (response.getStatus() != Status::OK)
        {
            return Result<Snapshot>(response.getStatus());
        }
        return Result<Snapshot>(response.getSnapshot());
    }

    Status RemoteReplica::pushFullState(const Snapshot &snapshot)
    {
        const auto response_result =
            call(PushStateRequestMessage(snapshot), MessageType::PUSH_STATE_RESPONSE, _timeout);
        if (!response_result.ok())
        {
            return response_result.status();
        }

        return static_cast<const PushStateResponseMessage &>(*response_result.value()).getStatus();
    }

    Status RemoteReplica::promoteToPrimary()
    {
        const auto response_result =
            call(PromoteRequestMessage(), MessageType::PROMOTE_RESPONSE, _client_op_timeout);
        if (!response_result.ok())
        {
            return response_result.status();
        }

        return static_cast<const PromoteResponseMessage &>(*response_result.value()).getStatus();
    }

    Status RemoteReplica::ping()
    {
        const auto response_result = call(PingMessage(_name), MessageType::PING_RESPONSE, _timeout);
        return response_result.status();
    }
} // namespace passive_kv
