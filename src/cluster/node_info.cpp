#include "node_info.hpp"
#include "replica_naming.hpp"
#include "../common/logger.hpp"
#include <sstream>
#include <algorithm>
#include <mutex>

namespace passive_kv
{
    NodeInfo::NodeInfo(std::string name, std::string address, Port port)
        : _name(std::move(name)), _address(std::move(address)), _port(port)
    {
        updateLastSeen();
    }

    NodeInfo::NodeInfo(const NodeInfo &other)
        : _name(other._name), _address(other._address), _port(other._port),
          _last_seen_ms(other._last_seen_ms.load())
    {
    }

    NodeInfo &NodeInfo::operator=(const NodeInfo &other)
    {
        if (this != &other)
        {
            _name = other._name;
            _address = other._address;
            _port = other._port;
            _last_seen_ms = other._last_seen_ms.load();
        }
        return *this;
    }

    std::string NodeInfo::getEndpoint() const
    {
        return ReplicaNaming::formatEndpoint(_address, _port);
    }

    void NodeInfo::updateLastSeen()
    {
        _last_seen_ms = getCurrentTimeMs();
    }

    std::chrono::milliseconds NodeInfo::getLastSeenAge() const
    {
        return std::chrono::milliseconds(getCurrentTimeMs() - _last_seen_ms.load());
    }

    std::string NodeInfo::toString() const
    {
        std::ostringstream oss;
        oss << "NodeInfo{name=" << _name
            << ", endpoint=" << getEndpoint()
            << ", last_seen_age=" << getLastSeenAge().count() << "ms}";
        return oss.str();
    }

    std::int64_t NodeInfo::getCurrentTimeMs()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    bool NodeRegistry::addNode(const NodeInfo &node)
    {
        const std::unique_lock lock(_registry_mutex);

        auto &slot = _nodes[node.getName()];
        const bool replaced = slot != nullptr;
        slot = std::make_shared<NodeInfo>(node);

        LOG_DEBUG("%s %s", replaced ? "Rebound" : "Bound", slot->toString().c_str());
        return replaced;
    }

    bool NodeRegistry::removeNode(const std::string &name)
    {
        const std::unique_lock lock(_registry_mutex);
        return _nodes.erase(name) > 0;
    }

    std::shared_ptr<NodeInfo> NodeRegistry::getNode(const std::string &name) const
    {
        const std::shared_lock lock(_registry_mutex);

        const auto it = _nodes.find(name);
        return it != _nodes.end() ? it->second : nullptr;
    }

    std::vector<std::string> NodeRegistry::getNames() const
    {
        std::vector<std::string> names;
        {
            const std::shared_lock lock(_registry_mutex);
            names.reserve(_nodes.size());
            for (const auto &[name, node] : _nodes)
            {
                names.push_back(name);
            }
        }

        std::sort(names.begin(), names.end());
        return names;
    }

    std::size_t NodeRegistry::size() const
    {
        const std::shared_lock lock(_registry_mutex);
        return _nodes.size();
    }

    bool NodeRegistry::empty() const
    {
        const std::shared_lock lock(_registry_mutex);
        return _nodes.empty();
    }

    bool NodeRegistry::contains(const std::string &name) const
    {
        const std::shared_lock lock(_registry_mutex);
        return _nodes.find(name) != _nodes.end();
    }

    void NodeRegistry::clear()
    {
        const std::unique_lock lock(_registry_mutex);
        _nodes.clear();
    }
} // namespace passive_kv
