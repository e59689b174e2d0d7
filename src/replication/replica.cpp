#include "replica.hpp"
#include "../cluster/replica_naming.hpp"
#include "../common/logger.hpp"
#include <algorithm>

namespace passive_kv
{
    std::string replicaRoleToString(ReplicaRole role)
    {
        switch (role)
        {
        case ReplicaRole::BACKUP:
            return "BACKUP";
        case ReplicaRole::PRIMARY:
            return "PRIMARY";
        default:
            return "UNKNOWN";
        }
    }

    Replica::Replica(ReplicaId id, ReplicaRole role, ReplicaRegistryPtr registry,
                     std::string name_prefix, std::vector<ReplicaHandlePtr> initial_backups)
        : _id(id),
          _name_prefix(std::move(name_prefix)),
          _name(ReplicaNaming::formatName(_name_prefix, id)),
          _registry(std::move(registry)),
          _role(role),
          _backups(std::move(initial_backups))
    {
        _backups.erase(std::remove(_backups.begin(), _backups.end(), nullptr), _backups.end());
        LOG_INFO("%s starting as %s with %zu initial backup(s)", _name.c_str(),
                 replicaRoleToString(_role).c_str(), _backups.size());
    }

    Result<bool> Replica::handleClientPut(const Key &key, const Value &value)
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        if (_role != ReplicaRole::PRIMARY)
        {
            LOG_WARN("%s rejected put of '%s': not the primary", _name.c_str(), key.c_str());
            return Result<bool>(false);
        }

        const auto put_status = _store.put(key, value);
        if (put_status != Status::OK)
        {
            return Result<bool>(put_status);
        }

        const auto snapshot = _store.snapshot();
        _backups = discoverBackups();

        auto it = _backups.begin();
        while (it != _backups.end())
        {
            const auto push_status = (*it)->pushFullState(snapshot);
            if (push_status != Status::OK)
            {
                LOG_WARN("%s dropped backup %s: state push failed (%s)", _name.c_str(),
                         (*it)->getName().c_str(), statusToString(push_status));
                it = _backups.erase(it);
                continue;
            }
            ++it;
        }

        LOG_DEBUG("%s stored '%s' and replicated to %zu backup(s)", _name.c_str(), key.c_str(), _backups.size());
        return Result<bool>(true);
    }

    Result<std::optional<Value>> Replica::handleClientGet(const Key &key)
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        const auto result = _store.get(key);
        if (result.ok())
        {
            return Result<std::optional<Value>>(std::optional<Value>(result.value()));
        }
        if (result.status() == Status::NOT_FOUND)
        {
            return Result<std::optional<Value>>(std::optional<Value>());
        }
        return Result<std::optional<Value>>(result.status());
    }

    Result<Snapshot> Replica::getState()
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);
        return Result<Snapshot>(_store.snapshot());
    }

    Status Replica::pushFullState(const Snapshot &snapshot)
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        _store.replaceAll(snapshot);
        LOG_DEBUG("%s installed pushed state (%zu keys)", _name.c_str(), snapshot.size());
        return Status::OK;
    }

    Status Replica::promoteToPrimary()
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        if (_role == ReplicaRole::PRIMARY)
        {
            LOG_INFO("%s is already the primary", _name.c_str());
            return Status::OK;
        }

        _role = ReplicaRole::PRIMARY;
        _backups = discoverBackups();

        LOG_INFO("%s promoted to PRIMARY with %zu backup(s)", _name.c_str(), _backups.size());
        return Status::OK;
    }

    Status Replica::ping()
    {
        return Status::OK;
    }

    ReplicaRole Replica::getRole() const
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);
        return _role;
    }

    std::vector<std::string> Replica::getBackupNames() const
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        std::vector<std::string> names;
        names.reserve(_backups.size());
        for (const auto &backup : _backups)
        {
            names.push_back(backup->getName());
        }
        return names;
    }

    std::vector<std::string> Replica::getIgnoredNames() const
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        std::vector<std::string> names(_ignored_names.begin(), _ignored_names.end());
        std::sort(names.begin(), names.end());
        return names;
    }

    std::vector<ReplicaHandlePtr> Replica::discoverBackups()
    {
        std::vector<ReplicaHandlePtr> found;

        if (!_registry)
        {
            return found;
        }

        const auto names_result = _registry->listNames();
        if (!names_result.ok())
        {
            LOG_WARN("%s could not list the registry: %s", _name.c_str(), statusToString(names_result.status()));
            return found;
        }

        for (const auto &name : names_result.value())
        {
            if (!ReplicaNaming::matches(_name_prefix, name) || name == _name)
            {
                continue;
            }

            if (_ignored_names.count(name) > 0)
            {
                continue;
            }

            const auto lookup_result = _registry->lookup(name);
            if (!lookup_result.ok() || !lookup_result.value())
            {
                LOG_WARN("%s ignoring %s: lookup failed (%s)", _name.c_str(), name.c_str(),
                         statusToString(lookup_result.status()));
                _ignored_names.insert(name);
                continue;
            }

            const auto &handle = lookup_result.value();
            const auto ping_status = handle->ping();
            if (ping_status != Status::OK)
            {
                LOG_WARN("%s ignoring %s: ping failed (%s)", _name.c_str(), name.c_str(),
                         statusToString(ping_status));
                _ignored_names.insert(name);
                continue;
            }

            found.push_back(handle);
        }

        return found;
    }

    std::unique_ptr<Message> Replica::handleMessage(const Message &request)
    {
        const auto request_id = request.getMessageId();

        switch (request.getType())
        {
        case MessageType::PUT_REQUEST:
        {
            const auto &put = static_cast<const PutRequestMessage &>(request);
            const auto result = handleClientPut(put.getKey(), put.getValue());
            return std::make_unique<PutResponseMessage>(request_id, result.status(), result.ok() && result.value());
        }
        case MessageType::GET_REQUEST:
        {
            const auto &get = static_cast<const GetRequestMessage &>(request);
            const auto result = handleClientGet(get.getKey());
            if (!result.ok())
            {
                return std::make_unique<GetResponseMessage>(request_id, result.status());
            }
            return std::make_unique<GetResponseMessage>(request_id, Status::OK, result.value());
        }
        case MessageType::GET_STATE_REQUEST:
        {
            auto result = getState();
            if (!result.ok())
            {
                return std::make_unique<GetStateResponseMessage>(request_id, result.status());
            }
            return std::make_unique<GetStateResponseMessage>(request_id, Status::OK, std::move(result.value()));
        }
        case MessageType::PING:
            return std::make_unique<PingResponseMessage>(request_id, _name);
        case MessageType::PUSH_STATE_REQUEST:
        {
            const auto &push = static_cast<const PushStateRequestMessage &>(request);
            return std::make_unique<PushStateResponseMessage>(request_id, pushFullState(push.getSnapshot()));
        }
        case MessageType::PROMOTE_REQUEST:
            return std::make_unique<PromoteResponseMessage>(request_id, promoteToPrimary());
        default:
            LOG_WARN("%s received unsupported %s", _name.c_str(), messageTypeToString(request.getType()).c_str());
            return std::make_unique<ErrorResponseMessage>(request_id, Status::INVALID_REQUEST,
                                                          "Unsupported message type");
        }
    }
} // namespace passive_kv
