#include "replica_naming.hpp"
#include <algorithm>
#include <cctype>

namespace passive_kv
{
    std::string ReplicaNaming::formatName(const std::string &prefix, ReplicaId id)
    {
        return prefix + std::to_string(id);
    }

    bool ReplicaNaming::matches(const std::string &prefix, const std::string &name)
    {
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
        {
            return false;
        }

        return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()), name.end(),
                           [](unsigned char c)
                           { return std::isdigit(c) != 0; });
    }

    Result<ReplicaId> ReplicaNaming::parseId(const std::string &prefix, const std::string &name)
    {
        if (!matches(prefix, name))
        {
            return Result<ReplicaId>(Status::INVALID_REQUEST);
        }

        try
        {
            const auto parsed = std::stoul(name.substr(prefix.size()));
            if (parsed == 0 || parsed > UINT32_MAX)
            {
                return Result<ReplicaId>(Status::INVALID_REQUEST);
            }
            return Result<ReplicaId>(static_cast<ReplicaId>(parsed));
        }
        catch (const std::out_of_range &)
        {
            return Result<ReplicaId>(Status::INVALID_REQUEST);
        }
    }

    Result<std::pair<std::string, Port>> ReplicaNaming::parseEndpoint(const std::string &endpoint)
    {
        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 >= endpoint.size())
        {
            return Result<std::pair<std::string, Port>>(Status::INVALID_REQUEST);
        }

        const auto host = endpoint.substr(0, colon_pos);
        const auto port_str = endpoint.substr(colon_pos + 1);

        if (!std::all_of(port_str.begin(), port_str.end(), [](unsigned char c)
                         { return std::isdigit(c) != 0; }) ||
            port_str.size() > 5)
        {
            return Result<std::pair<std::string, Port>>(Status::INVALID_REQUEST);
        }

        const auto port = std::stoul(port_str);
        if (port == 0 || port > 65535)
        {
            return Result<std::pair<std::string, Port>>(Status::INVALID_REQUEST);
        }

        return Result<std::pair<std::string, Port>>(std::make_pair(host, static_cast<Port>(port)));
    }

    std::string ReplicaNaming::formatEndpoint(const std::string &host, Port port)
    {
        return host + ":" + std::to_string(port);
    }
} // namespace passive_kv
