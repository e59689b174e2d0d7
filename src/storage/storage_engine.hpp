#ifndef __STORAGE_ENGINE_HPP__
#define __STORAGE_ENGINE_HPP__

#include "../common/types.hpp"
#include <unordered_map>
#include <shared_mutex>
#include <vector>

namespace passive_kv
{
    class StorageEngine
    {
    public:
        StorageEngine() = default;
        virtual ~StorageEngine() = default;

        virtual Result<Value> get(const Key &key) const = 0;
        virtual Status put(const Key &key, const Value &value) = 0;
        virtual Status remove(const Key &key) = 0;
        virtual bool exists(const Key &key) const = 0;

        // Full copy of the current contents
        [[nodiscard]] virtual Snapshot snapshot() const = 0;
        // Discards the current contents and installs `state` in their place
        virtual void replaceAll(Snapshot state) = 0;

        [[nodiscard]] virtual std::size_t size() const = 0;
        [[nodiscard]] virtual std::vector<Key> getAllKeys() const = 0;
        virtual void clear() = 0;
    };

    class InMemoryStorageEngine : public StorageEngine
    {
    public:
        InMemoryStorageEngine() = default;
        ~InMemoryStorageEngine() override = default;

        // Non-copyable
        InMemoryStorageEngine(const InMemoryStorageEngine &) = delete;
        InMemoryStorageEngine &operator=(const InMemoryStorageEngine &) = delete;

        Result<Value> get(const Key &key) const override;
        Status put(const Key &key, const Value &value) override;
        Status remove(const Key &key) override;
        bool exists(const Key &key) const override;

        [[nodiscard]] Snapshot snapshot() const override;
        void replaceAll(Snapshot state) override;

        [[nodiscard]] std::size_t size() const override;
        [[nodiscard]] std::vector<Key> getAllKeys() const override;
        void clear() override;

    private:
        mutable std::shared_mutex _mutex;
        Snapshot _data;
    };
} // passive_kv

#endif // __STORAGE_ENGINE_HPP__
