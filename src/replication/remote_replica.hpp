#ifndef __REMOTE_REPLICA_HPP__
#define __REMOTE_REPLICA_HPP__

#include "replica_api.hpp"
#include "../network/message.hpp"
#include <chrono>
#include <memory>

namespace passive_kv
{
    // Handle to a replica in another process. Each call opens its own
    // connection, so a dead peer shows up as NETWORK_ERROR on the very call that
    // touches it.
    //
    // Client puts, gets and promotions wait for client_op_timeout: the remote
    // side answers them only after its own pings and pushes complete. The
    // remaining calls wait for timeout.
    class RemoteReplica : public ReplicaHandle
    {
    public:
        RemoteReplica(std::string name, std::string host, Port port,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000),
                      std::chrono::milliseconds client_op_timeout = std::chrono::milliseconds(30000));

        Result<bool> handleClientPut(const Key &key, const Value &value) override;
        Result<std::optional<Value>> handleClientGet(const Key &key) override;
        Result<Snapshot> getState() override;

        Status pushFullState(const Snapshot &snapshot) override;
        Status promoteToPrimary() override;
        Status ping() override;

        [[nodiscard]] const std::string &getName() const override { return _name; }
        [[nodiscard]] const std::string &getHost() const noexcept { return _host; }
        [[nodiscard]] Port getPort() const noexcept { return _port; }

    private:
        std::string _name;
        std::string _host;
        Port _port;
        std::chrono::milliseconds _timeout;
        std::chrono::milliseconds _client_op_timeout;

        Result<std::unique_ptr<Message>> call(const Message &request, MessageType expected,
                                              std::chrono::milliseconds timeout);
    };
} // namespace passive_kv

#endif // __REMOTE_REPLICA_HPP__
