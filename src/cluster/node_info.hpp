#ifndef __NODE_INFO_HPP__
#define __NODE_INFO_HPP__

#include "../common/types.hpp"
#include <string>
#include <chrono>
#include <unordered_map>
#include <atomic>
#include <vector>
#include <memory>
#include <shared_mutex>

namespace passive_kv
{
    // A published replica endpoint, as held by the registry
    class NodeInfo
    {
    public:
        NodeInfo() = default;
        NodeInfo(std::string name, std::string address, Port port);

        NodeInfo(const NodeInfo &other);
        NodeInfo &operator=(const NodeInfo &other);

        ~NodeInfo() = default;

        [[nodiscard]] const std::string &getName() const noexcept { return _name; }
        [[nodiscard]] const std::string &getAddress() const noexcept { return _address; }
        [[nodiscard]] Port getPort() const noexcept { return _port; }
        [[nodiscard]] std::string getEndpoint() const;

        void updateLastSeen();
        [[nodiscard]] std::chrono::milliseconds getLastSeenAge() const;

        [[nodiscard]] std::string toString() const;

    private:
        std::string _name;
        std::string _address;
        Port _port = 0;

        std::atomic<std::int64_t> _last_seen_ms{0};

        [[nodiscard]] static std::int64_t getCurrentTimeMs();
    };

    // Thread-safe name -> endpoint table. Binding an existing name replaces the entry.
    class NodeRegistry
    {
    public:
        NodeRegistry() = default;
        ~NodeRegistry() = default;

        NodeRegistry(const NodeRegistry &) = delete;
        NodeRegistry &operator=(const NodeRegistry &) = delete;

        // Returns true when an entry with the same name was replaced
        bool addNode(const NodeInfo &node);
        bool removeNode(const std::string &name);

        [[nodiscard]] std::shared_ptr<NodeInfo> getNode(const std::string &name) const;
        // Sorted by name
        [[nodiscard]] std::vector<std::string> getNames() const;

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] bool empty() const;
        [[nodiscard]] bool contains(const std::string &name) const;
        void clear();

    private:
        mutable std::shared_mutex _registry_mutex;
        std::unordered_map<std::string, std::shared_ptr<NodeInfo>> _nodes;
    };
} // namespace passive_kv

#endif // __NODE_INFO_HPP__
