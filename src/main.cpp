#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>

#include "common/logger.hpp"
#include "common/config.hpp"
#include "common/types.hpp"
#include "cluster/replica_naming.hpp"
#include "dispatcher/dispatcher.hpp"
#include "network/tcp_client.hpp"
#include "network/tcp_server.hpp"
#include "registry/registry_server.hpp"
#include "registry/remote_registry.hpp"
#include "replication/replica.hpp"

using namespace passive_kv;

namespace
{
    std::atomic<bool> g_shutdown_requested{false};

    void handleSignal(int)
    {
        g_shutdown_requested = true;
    }

    void installSignalHandlers()
    {
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
    }

    void waitForShutdown()
    {
        while (!g_shutdown_requested)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOG_INFO("Shutdown requested");
    }

    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program
                  << " <registry|replica|dispatcher|client> [--config <file>] [key=value ...]\n"
                  << "\n"
                  << "  registry    serve the replica name registry on registry_port\n"
                  << "  replica     run replica <replica_id> as <role> and publish it in the registry\n"
                  << "  dispatcher  front the replicas on dispatcher_port with automatic failover\n"
                  << "  client      interactive client: put <key> <value> | get <key> | quit\n";
    }

    // Looks up a replica by id; nullptr (logged) when the registry does not know it
    ReplicaHandlePtr resolveReplica(ReplicaRegistry &registry, const std::string &prefix, ReplicaId id)
    {
        const auto name = ReplicaNaming::formatName(prefix, id);
        auto result = registry.lookup(name);
        if (!result.ok())
        {
            LOG_WARN("Could not resolve %s: %s", name.c_str(), statusToString(result.status()));
            return nullptr;
        }
        return result.value();
    }

    std::vector<ReplicaHandlePtr> resolveReplicas(ReplicaRegistry &registry, const std::string &prefix,
                                                  const std::vector<ReplicaId> &ids)
    {
        std::vector<ReplicaHandlePtr> handles;
        for (const auto id : ids)
        {
            auto handle = resolveReplica(registry, prefix, id);
            if (handle)
            {
                handles.push_back(std::move(handle));
            }
        }
        return handles;
    }

    int runRegistry(const Config &config)
    {
        RegistryServer server(config.getRegistryPort());
        if (server.start() != Status::OK)
        {
            LOG_ERROR("Failed to start registry on port %u", static_cast<unsigned>(config.getRegistryPort()));
            return 1;
        }

        waitForShutdown();
        server.stop();
        return 0;
    }

    int runReplica(const Config &config)
    {
        auto registry = std::make_shared<RemoteRegistry>(config.getRegistryHost(), config.getRegistryPort(),
                                                         config.getRpcTimeout(), config.getClientOpTimeout());

        const auto role = config.getStartAsPrimary() ? ReplicaRole::PRIMARY : ReplicaRole::BACKUP;
        std::vector<ReplicaHandlePtr> initial_backups;
        if (role == ReplicaRole::PRIMARY)
        {
            initial_backups = resolveReplicas(*registry, config.getReplicaNamePrefix(), config.getInitialBackups());
        }

        auto replica = std::make_shared<Replica>(config.getReplicaId(), role, registry,
                                                 config.getReplicaNamePrefix(), std::move(initial_backups));

        TcpServer server(config.getPort());
        server.setMessageHandler([replica](const Message &request, const Connection &)
                                 { return replica->handleMessage(request); });

        if (server.start() != Status::OK)
        {
            LOG_ERROR("Failed to start %s on port %u", replica->getName().c_str(),
                      static_cast<unsigned>(config.getPort()));
            return 1;
        }

        const auto publish_status = registry->publish(replica->getName(), config.getHost(), server.getPort());
        if (publish_status != Status::OK)
        {
            LOG_ERROR("Failed to publish %s: %s", replica->getName().c_str(), statusToString(publish_status));
            server.stop();
            return 1;
        }

        LOG_INFO("%s ready as %s on %s", replica->getName().c_str(),
                 replicaRoleToString(replica->getRole()).c_str(),
                 ReplicaNaming::formatEndpoint(config.getHost(), server.getPort()).c_str());

        waitForShutdown();
        server.stop();
        return 0;
    }

    int runDispatcher(const Config &config)
    {
        auto registry = std::make_shared<RemoteRegistry>(config.getRegistryHost(), config.getRegistryPort(),
                                                         config.getRpcTimeout(), config.getClientOpTimeout());
        const auto &prefix = config.getReplicaNamePrefix();

        auto primary = resolveReplica(*registry, prefix, config.getPrimaryId());
        auto backups = resolveReplicas(*registry, prefix, config.getInitialBackups());

        Dispatcher dispatcher(registry, std::move(primary), std::move(backups), prefix,
                              config.getDiscoveryInterval());

        TcpServer server(config.getDispatcherPort());
        server.setMessageHandler([&dispatcher](const Message &request, const Connection &)
                                 { return dispatcher.handleMessage(request); });

        if (server.start() != Status::OK)
        {
            LOG_ERROR("Failed to start dispatcher on port %u", static_cast<unsigned>(config.getDispatcherPort()));
            return 1;
        }
        dispatcher.start();

        LOG_INFO("Dispatcher ready on port %u", static_cast<unsigned>(server.getPort()));

        waitForShutdown();
        server.stop();
        dispatcher.stop();
        return 0;
    }

    int runClient(const Config &config)
    {
        TcpClient client(config.getRpcTimeout());
        client.setDefaultTimeout(config.getClientOpTimeout());

        if (client.connect(config.getDispatcherHost(), config.getDispatcherPort()) != Status::OK)
        {
            LOG_ERROR("Cannot reach dispatcher at %s:%u", config.getDispatcherHost().c_str(),
                      static_cast<unsigned>(config.getDispatcherPort()));
            return 1;
        }

        std::cout << "Connected to " << config.getDispatcherHost() << ":" << config.getDispatcherPort()
                  << ". Commands: put <key> <value> | get <key> | quit" << std::endl;

        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line))
        {
            std::istringstream iss(line);
            std::string command;
            iss >> command;

            if (command.empty())
            {
                continue;
            }

            if (command == "quit" || command == "exit")
            {
                break;
            }

            if (command == "put")
            {
                std::string key;
                iss >> key;
                std::string value;
                std::getline(iss >> std::ws, value);
                if (key.empty())
                {
                    std::cout << "usage: put <key> <value>" << std::endl;
                    continue;
                }

                const auto result = client.put(key, value);
                if (!result.ok())
                {
                    std::cout << "ERROR: " << statusToString(result.status()) << std::endl;
                }
                else
                {
                    std::cout << (result.value() ? "OK" : "FAILED") << std::endl;
                }
            }
            else if (command == "get")
            {
                std::string key;
                iss >> key;
                if (key.empty())
                {
                    std::cout << "usage: get <key>" << std::endl;
                    continue;
                }

                const auto result = client.get(key);
                if (!result.ok())
                {
                    std::cout << "ERROR: " << statusToString(result.status()) << std::endl;
                }
                else if (result.value())
                {
                    std::cout << *result.value() << std::endl;
                }
                else
                {
                    std::cout << "(not found)" << std::endl;
                }
            }
            else
            {
                std::cout << "unknown command: " << command << std::endl;
            }
        }

        return 0;
    }
} // namespace

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return 2;
    }

    const std::string mode = argv[1];
    auto &config = Config::getInstance();

    std::vector<std::string> overrides;
    for (int i = 2; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                printUsage(argv[0]);
                return 2;
            }
            if (!config.loadFromFile(argv[++i]))
            {
                return 1;
            }
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            overrides.push_back(arg);
        }
    }

    // Command-line settings win over the config file
    for (const auto &line : overrides)
    {
        if (!config.applyOverride(line))
        {
            return 1;
        }
    }

    if (!Logger::getInstance().setLevel(config.getLogLevel()))
    {
        LOG_WARN("Unknown log_level '%s', keeping info", config.getLogLevel().c_str());
    }

    try
    {
        if (mode == "registry")
        {
            installSignalHandlers();
            return runRegistry(config);
        }
        if (mode == "replica")
        {
            installSignalHandlers();
            return runReplica(config);
        }
        if (mode == "dispatcher")
        {
            installSignalHandlers();
            return runDispatcher(config);
        }
        if (mode == "client")
        {
            return runClient(config);
        }
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Application error: %s", e.what());
        return 1;
    }

    printUsage(argv[0]);
    return 2;
}
