#ifndef __REPLICA_NAMING_HPP__
#define __REPLICA_NAMING_HPP__

#include "../common/types.hpp"
#include <string>
#include <utility>

namespace passive_kv
{
    // Registry names are "<prefix><positive integer>", e.g. "replica3"
    class ReplicaNaming
    {
    public:
        [[nodiscard]] static std::string formatName(const std::string &prefix, ReplicaId id);

        // True when `name` is exactly `prefix` followed by one or more digits
        [[nodiscard]] static bool matches(const std::string &prefix, const std::string &name);

        // The numeric suffix of a matching name; INVALID_REQUEST otherwise
        [[nodiscard]] static Result<ReplicaId> parseId(const std::string &prefix, const std::string &name);

        // "host:port"
        [[nodiscard]] static Result<std::pair<std::string, Port>> parseEndpoint(const std::string &endpoint);
        [[nodiscard]] static std::string formatEndpoint(const std::string &host, Port port);
    };
} // namespace passive_kv

#endif // __REPLICA_NAMING_HPP__
