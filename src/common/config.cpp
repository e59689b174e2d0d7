#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>

namespace passive_kv
{
    namespace
    {
        std::string trim(const std::string &str)
        {
            const auto first = str.find_first_not_of(" \t\r");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = str.find_last_not_of(" \t\r");
            return str.substr(first, last - first + 1);
        }

        Port parsePort(const std::string &value)
        {
            const auto parsed = std::stoul(value);
            if (parsed > 65535)
            {
                throw std::out_of_range("port out of range: " + value);
            }
            return static_cast<Port>(parsed);
        }

        ReplicaId parseReplicaId(const std::string &value)
        {
            const auto parsed = std::stoul(value);
            if (parsed == 0)
            {
                throw std::invalid_argument("replica ids are positive: " + value);
            }
            return static_cast<ReplicaId>(parsed);
        }
    } // namespace

    bool Config::loadFromFile(const std::string &filename)
    {
        std::ifstream file(filename);
        if (!file.is_open())
        {
            LOG_ERROR("Failed to open config file: %s", filename.c_str());
            return false;
        }

        std::string line;
        while (std::getline(file, line))
        {
            line = trim(line);
            if (line.empty() || line[0] == '#')
            {
                continue;
            }

            if (!applyOverride(line))
            {
                return false;
            }
        }

        LOG_INFO("Configuration loaded from: %s", filename.c_str());
        return true;
    }

    bool Config::applyOverride(const std::string &line)
    {
        const auto pos = line.find('=');
        if (pos == std::string::npos)
        {
            LOG_WARN("Invalid config line: %s", line.c_str());
            return true;
        }

        const auto key = trim(line.substr(0, pos));
        const auto value = trim(line.substr(pos + 1));

        try
        {
            return applySetting(key, value);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("Error parsing config value for key '%s': %s", key.c_str(), e.what());
            return false;
        }
    }

    bool Config::applySetting(const std::string &key, const std::string &value)
    {
        if (key == "host")
        {
            _host = value;
        }
        else if (key == "port")
        {
            _port = parsePort(value);
        }
        else if (key == "registry_host")
        {
            _registry_host = value;
        }
        else if (key == "registry_port")
        {
            _registry_port = parsePort(value);
        }
        else if (key == "replica_name_prefix")
        {
            if (value.empty())
            {
                LOG_ERROR("replica_name_prefix must not be empty");
                return false;
            }
            _replica_name_prefix = value;
        }
        else if (key == "replica_id")
        {
            _replica_id = parseReplicaId(value);
        }
        else if (key == "role")
        {
            if (value == "primary")
            {
                _start_as_primary = true;
            }
            else if (value == "backup")
            {
                _start_as_primary = false;
            }
            else
            {
                LOG_ERROR("Unknown role '%s' (expected primary or backup)", value.c_str());
                return false;
            }
        }
        else if (key == "primary_id")
        {
            _primary_id = parseReplicaId(value);
        }
        else if (key == "initial_backups")
        {
            std::vector<ReplicaId> backups;
            std::stringstream ss(value);
            std::string id;
            while (std::getline(ss, id, ','))
            {
                id = trim(id);
                if (!id.empty())
                {
                    backups.push_back(parseReplicaId(id));
                }
            }
            _initial_backups = std::move(backups);
        }
        else if (key == "dispatcher_host")
        {
            _dispatcher_host = value;
        }
        else if (key == "dispatcher_port")
        {
            _dispatcher_port = parsePort(value);
        }
        else if (key == "discovery_interval")
        {
            _discovery_interval = std::chrono::milliseconds(std::stoul(value));
        }
        else if (key == "rpc_timeout")
        {
            _rpc_timeout = std::chrono::milliseconds(std::stoul(value));
        }
        else if (key == "client_op_timeout")
        {
            _client_op_timeout = std::chrono::milliseconds(std::stoul(value));
        }
        else if (key == "log_level")
        {
            _log_level = value;
        }
        else
        {
            LOG_WARN("Unknown config key: %s", key.c_str());
        }
        return true;
    }

    bool Config::saveToFile(const std::string &filename) const
    {
        std::ofstream file(filename);
        if (!file.is_open())
        {
            LOG_ERROR("Failed to create config file: %s", filename.c_str());
            return false;
        }

        file << "# passive_kv configuration\n";
        file << "# Generated automatically\n\n";

        file << "# Local endpoint\n";
        file << "host=" << _host << "\n";
        file << "port=" << _port << "\n\n";

        file << "# Registry\n";
        file << "registry_host=" << _registry_host << "\n";
        file << "registry_port=" << _registry_port << "\n";
        file << "replica_name_prefix=" << _replica_name_prefix << "\n\n";

        file << "# Topology\n";
        file << "replica_id=" << _replica_id << "\n";
        file << "role=" << (_start_as_primary ? "primary" : "backup") << "\n";
        file << "primary_id=" << _primary_id << "\n";
        if (!_initial_backups.empty())
        {
            file << "initial_backups=";
            for (std::size_t i = 0; i < _initial_backups.size(); ++i)
            {
                if (i > 0)
                    file << ",";
                file << _initial_backups[i];
            }
            file << "\n";
        }
        file << "\n";

        file << "# Dispatcher\n";
        file << "dispatcher_host=" << _dispatcher_host << "\n";
        file << "dispatcher_port=" << _dispatcher_port << "\n";
        file << "discovery_interval=" << _discovery_interval.count() << "\n\n";

        file << "# RPC and logging\n";
        file << "rpc_timeout=" << _rpc_timeout.count() << "\n";
        file << "client_op_timeout=" << _client_op_timeout.count() << "\n";
        file << "log_level=" << _log_level << "\n";

        if (!file.good())
        {
            LOG_ERROR("Error writing to config file: %s", filename.c_str());
            return false;
        }

        LOG_INFO("Configuration saved to: %s", filename.c_str());
        return true;
    }

    void Config::resetToDefaults()
    {
        _host = "127.0.0.1";
        _port = 0;
        _registry_host = "127.0.0.1";
        _registry_port = 1099;
        _replica_name_prefix = "replica";
        _replica_id = 1;
        _start_as_primary = false;
        _primary_id = 1;
        _initial_backups.clear();
        _dispatcher_host = "127.0.0.1";
        _dispatcher_port = 50051;
        _discovery_interval = std::chrono::milliseconds(5000);
        _rpc_timeout = std::chrono::milliseconds(3000);
        _client_op_timeout = std::chrono::milliseconds(30000);
        _log_level = "info";
    }
} // namespace passive_kv
