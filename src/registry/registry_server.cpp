#include "registry_server.hpp"
#include "../common/logger.hpp"

namespace passive_kv
{
    RegistryServer::RegistryServer(Port port, const std::string &bind_address)
        : _server(port, bind_address)
    {
        _server.setMessageHandler([this](const Message &request, const Connection &)
                                  { return handleMessage(request); });
    }

    RegistryServer::~RegistryServer()
    {
        stop();
    }

    Status RegistryServer::start()
    {
        const auto status = _server.start();
        if (status == Status::OK)
        {
            LOG_INFO("Registry listening on port %u", static_cast<unsigned>(_server.getPort()));
        }
        return status;
    }

    void RegistryServer::stop()
    {
        _server.stop();
    }

    std::unique_ptr<Message> RegistryServer::handleMessage(const Message &request)
    {
        const auto request_id = request.getMessageId();

        switch (request.getType())
        {
        case MessageType::REGISTRY_BIND_REQUEST:
        {
            const auto &bind = static_cast<const RegistryBindRequestMessage &>(request);
            if (bind.getName().empty() || bind.getAddress().empty() || bind.getPort() == 0)
            {
                LOG_WARN("Rejected bind with empty name, address or port");
                return std::make_unique<RegistryBindResponseMessage>(request_id, Status::INVALID_REQUEST);
            }

            const bool replaced = _nodes.addNode(NodeInfo(bind.getName(), bind.getAddress(), bind.getPort()));
            LOG_INFO("%s %s -> %s:%u", replaced ? "Rebound" : "Bound", bind.getName().c_str(),
                     bind.getAddress().c_str(), static_cast<unsigned>(bind.getPort()));
            return std::make_unique<RegistryBindResponseMessage>(request_id, Status::OK);
        }
        case MessageType::REGISTRY_LOOKUP_REQUEST:
        {
            const auto &lookup = static_cast<const RegistryLookupRequestMessage &>(request);
            const auto node = _nodes.getNode(lookup.getName());
            if (!node)
            {
                LOG_DEBUG("Lookup of unknown name %s", lookup.getName().c_str());
                return std::make_unique<RegistryLookupResponseMessage>(request_id, Status::NOT_FOUND);
            }

            LOG_DEBUG("Resolved %s", node->toString().c_str());
            return std::make_unique<RegistryLookupResponseMessage>(request_id, Status::OK,
                                                                   node->getAddress(), node->getPort());
        }
        case MessageType::REGISTRY_LIST_REQUEST:
            return std::make_unique<RegistryListResponseMessage>(request_id, Status::OK, _nodes.getNames());
        case MessageType::PING:
            return std::make_unique<PingResponseMessage>(request_id, "registry");
        default:
            LOG_WARN("Registry received unsupported %s", messageTypeToString(request.getType()).c_str());
            return std::make_unique<ErrorResponseMessage>(request_id, Status::INVALID_REQUEST,
                                                          "Unsupported message type");
        }
    }
} // namespace passive_kv
