#include "dispatcher.hpp"
#include "../cluster/replica_naming.hpp"
#include "../common/logger.hpp"
#include <algorithm>

namespace passive_kv
{
    Dispatcher::Dispatcher(ReplicaRegistryPtr registry,
                           ReplicaHandlePtr primary,
                           std::vector<ReplicaHandlePtr> backups,
                           std::string name_prefix,
                           std::chrono::milliseconds discovery_interval)
        : _registry(std::move(registry)),
          _name_prefix(std::move(name_prefix)),
          _discovery_interval(discovery_interval),
          _running(false),
          _should_stop(false)
    {
        for (auto &backup : backups)
        {
            if (backup)
            {
                _backup_queue.push_back(std::move(backup));
            }
        }

        if (primary)
        {
            LOG_INFO("Dispatcher starting with primary %s and %zu backup(s)",
                     primary->getName().c_str(), _backup_queue.size());
        }
        else
        {
            LOG_WARN("Dispatcher starting without a primary");
        }
        std::atomic_store(&_current_primary, std::move(primary));
    }

    Dispatcher::~Dispatcher()
    {
        stop();
    }

    Status Dispatcher::start()
    {
        if (_running)
        {
            return Status::OK;
        }

        _should_stop = false;
        _running = true;

        _discovery_thread = std::make_unique<std::thread>(&Dispatcher::discoveryLoop, this);

        LOG_INFO("Discovery loop started with interval: %ldms", static_cast<long>(_discovery_interval.count()));
        return Status::OK;
    }

    void Dispatcher::stop()
    {
        if (!_running)
        {
            return;
        }

        _should_stop = true;
        _running = false;

        {
            const std::lock_guard<std::mutex> lock(_discovery_mutex);
            _discovery_condition.notify_all();
        }

        if (_discovery_thread && _discovery_thread->joinable())
        {
            _discovery_thread->join();
        }
        _discovery_thread.reset();

        LOG_INFO("Discovery loop stopped");
    }

    template <typename T, typename Operation>
    Result<T> Dispatcher::invokeOnPrimary(const char *operation_name, Operation operation)
    {
        auto current = std::atomic_load(&_current_primary);

        while (current)
        {
            auto result = operation(*current);
            if (result.ok())
            {
                return result;
            }

            LOG_WARN("%s on primary %s failed (%s)", operation_name, current->getName().c_str(),
                     statusToString(result.status()));
            current = failoverFrom(current);
        }

        LOG_ERROR("No replica available to handle %s", operation_name);
        return Result<T>(Status::UNAVAILABLE);
    }

    Result<bool> Dispatcher::put(const Key &key, const Value &value)
    {
        return invokeOnPrimary<bool>("PUT", [&key, &value](ReplicaHandle &primary)
                                     { return primary.handleClientPut(key, value); });
    }

    Result<std::optional<Value>> Dispatcher::get(const Key &key)
    {
        return invokeOnPrimary<std::optional<Value>>("GET", [&key](ReplicaHandle &primary)
                                                     { return primary.handleClientGet(key); });
    }

    ReplicaHandlePtr Dispatcher::failoverFrom(const ReplicaHandlePtr &failed)
    {
        while (true)
        {
            ReplicaHandlePtr candidate;
            {
                const std::lock_guard<std::mutex> lock(_state_mutex);

                const auto installed = std::atomic_load(&_current_primary);
                if (installed && installed != failed)
                {
                    // A concurrent request already failed over
                    return installed;
                }

                if (_backup_queue.empty())
                {
                    if (installed)
                    {
                        LOG_ERROR("Primary %s lost and no backups remain", installed->getName().c_str());
                    }
                    std::atomic_store(&_current_primary, ReplicaHandlePtr());
                    return nullptr;
                }

                candidate = _backup_queue.front();
            }

            if (failoverToBackup(candidate) == Status::OK)
            {
                return candidate;
            }

            const std::lock_guard<std::mutex> lock(_state_mutex);
            removeFromQueue(candidate->getName());
        }
    }

    Status Dispatcher::failoverToBackup(const ReplicaHandlePtr &candidate)
    {
        if (!candidate)
        {
            return Status::UNAVAILABLE;
        }

        const std::lock_guard<std::mutex> lock(_state_mutex);

        const auto status = candidate->promoteToPrimary();
        if (status != Status::OK)
        {
            LOG_WARN("Failed to promote %s: %s", candidate->getName().c_str(), statusToString(status));
            return status;
        }

        std::atomic_store(&_current_primary, candidate);
        removeFromQueue(candidate->getName());

        LOG_INFO("Failed over to new primary %s (%zu backup(s) queued)", candidate->getName().c_str(),
                 _backup_queue.size());
        return Status::OK;
    }

    void Dispatcher::discoverNewReplicas()
    {
        const auto primary = std::atomic_load(&_current_primary);
        if (!primary)
        {
            LOG_DEBUG("No primary installed, skipping discovery");
            return;
        }

        const auto names_result = _registry->listNames();
        if (!names_result.ok())
        {
            LOG_WARN("Discovery could not list the registry: %s", statusToString(names_result.status()));
            return;
        }

        for (const auto &name : names_result.value())
        {
            if (_should_stop)
            {
                return;
            }

            if (!ReplicaNaming::matches(_name_prefix, name) || name == primary->getName())
            {
                continue;
            }

            {
                const std::lock_guard<std::mutex> lock(_state_mutex);
                if (_ignored_names.count(name) > 0 || isKnown(name))
                {
                    continue;
                }
            }

            const auto lookup_result = _registry->lookup(name);
            if (!lookup_result.ok() || !lookup_result.value())
            {
                ignoreName(name, "lookup failed");
                continue;
            }

            const auto &handle = lookup_result.value();
            if (handle->ping() != Status::OK)
            {
                ignoreName(name, "ping failed");
                continue;
            }

            const auto state_result = primary->getState();
            if (!state_result.ok())
            {
                ignoreName(name, "could not fetch state from the primary");
                continue;
            }

            if (handle->pushFullState(state_result.value()) != Status::OK)
            {
                ignoreName(name, "state push failed");
                continue;
            }

            const std::lock_guard<std::mutex> lock(_state_mutex);
            if (!isKnown(name))
            {
                _backup_queue.push_back(handle);
                LOG_INFO("Discovered new backup %s (%zu keys synced)", name.c_str(), state_result.value().size());
            }
        }
    }

    std::unique_ptr<Message> Dispatcher::handleMessage(const Message &request)
    {
        const auto request_id = request.getMessageId();

        switch (request.getType())
        {
        case MessageType::PUT_REQUEST:
        {
            const auto &put_request = static_cast<const PutRequestMessage &>(request);
            const auto result = put(put_request.getKey(), put_request.getValue());
            return std::make_unique<PutResponseMessage>(request_id, result.status(), result.ok() && result.value());
        }
        case MessageType::GET_REQUEST:
        {
            const auto &get_request = static_cast<const GetRequestMessage &>(request);
            const auto result = get(get_request.getKey());
            if (!result.ok())
            {
                return std::make_unique<GetResponseMessage>(request_id, result.status());
            }
            return std::make_unique<GetResponseMessage>(request_id, Status::OK, result.value());
        }
        case MessageType::PING:
            return std::make_unique<PingResponseMessage>(request_id, "dispatcher");
        default:
            LOG_WARN("Dispatcher received unsupported %s", messageTypeToString(request.getType()).c_str());
            return std::make_unique<ErrorResponseMessage>(request_id, Status::INVALID_REQUEST,
                                                          "Unsupported message type");
        }
    }

    ReplicaHandlePtr Dispatcher::getCurrentPrimary() const
    {
        return std::atomic_load(&_current_primary);
    }

    std::string Dispatcher::getCurrentPrimaryName() const
    {
        const auto primary = std::atomic_load(&_current_primary);
        return primary ? primary->getName() : std::string();
    }

    std::vector<std::string> Dispatcher::getBackupQueueNames() const
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        std::vector<std::string> names;
        names.reserve(_backup_queue.size());
        for (const auto &backup : _backup_queue)
        {
            names.push_back(backup->getName());
        }
        return names;
    }

    std::vector<std::string> Dispatcher::getIgnoredNames() const
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);

        std::vector<std::string> names(_ignored_names.begin(), _ignored_names.end());
        std::sort(names.begin(), names.end());
        return names;
    }

    void Dispatcher::discoveryLoop()
    {
        LOG_DEBUG("Discovery loop started");

        while (!_should_stop)
        {
            {
                std::unique_lock<std::mutex> lock(_discovery_mutex);
                _discovery_condition.wait_for(lock, _discovery_interval, [this]()
                                              { return _should_stop.load(); });
            }

            if (_should_stop)
            {
                break;
            }

            try
            {
                discoverNewReplicas();
            }
            catch (const std::exception &e)
            {
                LOG_ERROR("Exception in discovery loop: %s", e.what());
            }
        }

        LOG_DEBUG("Discovery loop finished");
    }

    void Dispatcher::ignoreName(const std::string &name, const char *reason)
    {
        const std::lock_guard<std::mutex> lock(_state_mutex);
        if (_ignored_names.insert(name).second)
        {
            LOG_WARN("Ignoring %s: %s", name.c_str(), reason);
        }
    }

    bool Dispatcher::isKnown(const std::string &name) const
    {
        const auto primary = std::atomic_load(&_current_primary);
        if (primary && primary->getName() == name)
        {
            return true;
        }

        return std::any_of(_backup_queue.begin(), _backup_queue.end(),
                           [&name](const ReplicaHandlePtr &backup)
                           { return backup->getName() == name; });
    }

    void Dispatcher::removeFromQueue(const std::string &name)
    {
        const auto before = _backup_queue.size();
        _backup_queue.erase(std::remove_if(_backup_queue.begin(), _backup_queue.end(),
                                           [&name](const ReplicaHandlePtr &backup)
                                           { return backup->getName() == name; }),
                            _backup_queue.end());

        if (_backup_queue.size() != before)
        {
            LOG_DEBUG("Removed %s from the backup queue", name.c_str());
        }
    }
} // namespace passive_kv
