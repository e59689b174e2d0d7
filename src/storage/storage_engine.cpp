#include "storage_engine.hpp"
#include "../common/logger.hpp"

namespace passive_kv
{
    Result<Value> InMemoryStorageEngine::get(const Key &key) const
    {
        const std::shared_lock lock(_mutex);

        const auto it = _data.find(key);
        if (it == _data.end())
        {
            LOG_DEBUG("Key not found: %s", key.c_str());
            return Result<Value>(Status::NOT_FOUND);
        }

        return Result<Value>(it->second);
    }

    Status InMemoryStorageEngine::put(const Key &key, const Value &value)
    {
        const std::unique_lock lock(_mutex);

        _data[key] = value;
        LOG_DEBUG("Stored key: %s -> %s", key.c_str(), value.c_str());
        return Status::OK;
    }

    Status InMemoryStorageEngine::remove(const Key &key)
    {
        const std::unique_lock lock(_mutex);

        const auto it = _data.find(key);
        if (it == _data.end())
        {
            return Status::NOT_FOUND;
        }

        _data.erase(it);
        LOG_DEBUG("Removed key: %s", key.c_str());
        return Status::OK;
    }

    bool InMemoryStorageEngine::exists(const Key &key) const
    {
        const std::shared_lock lock(_mutex);
        return _data.find(key) != _data.end();
    }

    Snapshot InMemoryStorageEngine::snapshot() const
    {
        const std::shared_lock lock(_mutex);
        return _data;
    }

    void InMemoryStorageEngine::replaceAll(Snapshot state)
    {
        const std::unique_lock lock(_mutex);
        _data = std::move(state);
        LOG_DEBUG("Replaced store contents: %zu keys", _data.size());
    }

    std::size_t InMemoryStorageEngine::size() const
    {
        const std::shared_lock lock(_mutex);
        return _data.size();
    }

    std::vector<Key> InMemoryStorageEngine::getAllKeys() const
    {
        const std::shared_lock lock(_mutex);

        std::vector<Key> keys;
        keys.reserve(_data.size());

        for (const auto &[key, _] : _data)
        {
            keys.push_back(key);
        }

        return keys;
    }

    void InMemoryStorageEngine::clear()
    {
        const std::unique_lock lock(_mutex);
        _data.clear();
        LOG_DEBUG("Cleared all data");
    }
} // passive_kv
