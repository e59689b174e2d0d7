#ifndef __TYPES_HPP__
#define __TYPES_HPP__

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace passive_kv
{
    using ReplicaId = std::uint32_t;
    using Key = std::string;
    using Value = std::string;
    using Snapshot = std::unordered_map<Key, Value>;
    using Timestamp = std::chrono::system_clock::time_point;

    using Port = uint16_t;

    enum class Status : std::uint8_t
    {
        OK,
        NOT_FOUND,
        NETWORK_ERROR,
        TIMEOUT,
        INTERNAL_ERROR,
        INVALID_REQUEST,
        UNAVAILABLE
    };

    [[nodiscard]] inline const char *statusToString(Status status) noexcept
    {
        switch (status)
        {
        case Status::OK:
            return "OK";
        case Status::NOT_FOUND:
            return "NOT_FOUND";
        case Status::NETWORK_ERROR:
            return "NETWORK_ERROR";
        case Status::TIMEOUT:
            return "TIMEOUT";
        case Status::INTERNAL_ERROR:
            return "INTERNAL_ERROR";
        case Status::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case Status::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "UNKNOWN";
        }
    }

    template <typename T>
    class Result
    {
    public:
        Result(T value) : _value(std::move(value)), _status(Status::OK)
        {
        }
        Result(Status status) : _status(status)
        {
        }

        bool ok() const { return _status == Status::OK; }
        Status status() const { return _status; }

        const T &value() const
        {
            if (!ok())
            {
                throw std::runtime_error("Accessing value of failed result");
            }
            return _value.value();
        }

        T &value()
        {
            if (!ok())
            {
                throw std::runtime_error("Accessing value of failed result");
            }
            return _value.value();
        }

    private:
        std::optional<T> _value;
        Status _status;
    };
} // namespace passive_kv

#endif // __TYPES_HPP__
