#include "remote_registry.hpp"
#include "../replication/remote_replica.hpp"
#include "../common/logger.hpp"

namespace passive_kv
{
    RemoteRegistry::RemoteRegistry(std::string host, Port port, std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds client_op_timeout)
        : _host(std::move(host)), _port(port), _timeout(timeout), _client_op_timeout(client_op_timeout),
          _client(timeout)
    {
        _client.setDefaultTimeout(timeout);
    }

    Result<std::unique_ptr<Message>> RemoteRegistry::request(const Message &message, MessageType expected)
    {
        const bool was_connected = _client.isConnected();
        if (!was_connected)
        {
            const auto connect_status = _client.connect(_host, _port);
            if (connect_status != Status::OK)
            {
                LOG_WARN("Registry at %s:%u unreachable", _host.c_str(), static_cast<unsigned>(_port));
                return Result<std::unique_ptr<Message>>(connect_status);
            }
        }

        auto response_result = _client.sendRequest(message);
        if (!response_result.ok() && response_result.status() == Status::NETWORK_ERROR && was_connected)
        {
            // The registry may have restarted since the last call
            response_result = _client.sendRequest(message);
        }
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

    Status RemoteRegistry::publish(const std::string &name, const std::string &address, Port port)
    {
        const auto response_result = request(RegistryBindRequestMessage(name, address, port),
                                             MessageType::REGISTRY_BIND_RESPONSE);
        if (!response_result.ok())
        {
            return response_result.status();
        }

        const auto status = static_cast<const RegistryBindResponseMessage &>(*response_result.value()).getStatus();
        if (status == Status::OK)
        {
            LOG_INFO("Published %s at %s:%u", name.c_str(), address.c_str(), static_cast<unsigned>(port));
        }
        return status;
    }

    Result<ReplicaHandlePtr> RemoteRegistry::lookup(const std::string &name)
    {
        const auto response_result = request(RegistryLookupRequestMessage(name),
                                             MessageType::REGISTRY_LOOKUP_RESPONSE);
        if (!response_result.ok())
        {
            return Result<ReplicaHandlePtr>(response_result.status());
        }

        const auto &response = static_cast<const RegistryLookupResponseMessage &>(*response_result.value());
        if (response.getStatus() != Status::OK)
        {
            return Result<ReplicaHandlePtr>(response.getStatus());
        }

        return Result<ReplicaHandlePtr>(
            std::make_shared<RemoteReplica>(name, response.getAddress(), response.getPort(), _timeout,
                                           _client_op_timeout));
    }

    Result<std::vector<std::string>> RemoteRegistry::listNames()
    {
        const auto response_result = request(RegistryListRequestMessage(), MessageType::REGISTRY_LIST_RESPONSE);
        if (!response_result.ok())
        {
            return Result<std::vector<std::string>>(response_result.status());
        }

        const auto &response = static_cast<const RegistryListResponseMessage &>(*response_result.value());
        if (response.getStatus() != Status::OK)
        {
            return Result<std::vector<std::string>>(response.getStatus());
        }

        return Result<std::vector<std::string>>(response.getNames());
    }
} // namespace passive_kv
