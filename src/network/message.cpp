#include "message.hpp"
#include "../common/logger.hpp"
#include <cstring>
#include <atomic>

namespace passive_kv
{
    std::string messageTypeToString(MessageType type)
    {
        switch (type)
        {
        case MessageType::PUT_REQUEST:
            return "PUT_REQUEST";
        case MessageType::GET_REQUEST:
            return "GET_REQUEST";
        case MessageType::GET_STATE_REQUEST:
            return "GET_STATE_REQUEST";
        case MessageType::PUT_RESPONSE:
            return "PUT_RESPONSE";
        case MessageType::GET_RESPONSE:
            return "GET_RESPONSE";
        case MessageType::GET_STATE_RESPONSE:
            return "GET_STATE_RESPONSE";
        case MessageType::PING:
            return "PING";
        case MessageType::PING_RESPONSE:
            return "PING_RESPONSE";
        case MessageType::PUSH_STATE_REQUEST:
            return "PUSH_STATE_REQUEST";
        case MessageType::PUSH_STATE_RESPONSE:
            return "PUSH_STATE_RESPONSE";
        case MessageType::PROMOTE_REQUEST:
            return "PROMOTE_REQUEST";
        case MessageType::PROMOTE_RESPONSE:
            return "PROMOTE_RESPONSE";
        case MessageType::REGISTRY_BIND_REQUEST:
            return "REGISTRY_BIND_REQUEST";
        case MessageType::REGISTRY_BIND_RESPONSE:
            return "REGISTRY_BIND_RESPONSE";
        case MessageType::REGISTRY_LOOKUP_REQUEST:
            return "REGISTRY_LOOKUP_REQUEST";
        case MessageType::REGISTRY_LOOKUP_RESPONSE:
            return "REGISTRY_LOOKUP_RESPONSE";
        case MessageType::REGISTRY_LIST_REQUEST:
            return "REGISTRY_LIST_REQUEST";
        case MessageType::REGISTRY_LIST_RESPONSE:
            return "REGISTRY_LIST_RESPONSE";
        case MessageType::ERROR_RESPONSE:
            return "ERROR_RESPONSE";
        default:
            return "UNKNOWN(" + std::to_string(static_cast<int>(type)) + ")";
        }
    }

    MessageHeader::MessageHeader(MessageType type, std::uint32_t message_id, std::uint32_t payload_size)
        : magic_number(MAGIC_NUMBER), version(VERSION), type(type),
          message_id(message_id), payload_size(payload_size)
    {
        const auto now = std::chrono::system_clock::now();
        timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }

    bool MessageHeader::isValid() const noexcept
    {
        return magic_number == MAGIC_NUMBER && version == VERSION && payload_size <= MAX_PAYLOAD_SIZE;
    }

    Message::Message(MessageType type)
        : _header(type, generateMessageId(), 0) {}

    Message::Message(MessageType type, std::uint32_t message_id)
        : _header(type, message_id, 0) {}

    std::uint32_t Message::generateMessageId() noexcept
    {
        static std::atomic<std::uint32_t> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }

    void Message::serializeHeader(std::vector<std::uint8_t> &buffer, std::uint32_t payload_size) const
    {
        wire::writeU32(buffer, _header.magic_number);
        wire::writeU8(buffer, _header.version);
        wire::writeU8(buffer, static_cast<std::uint8_t>(_header.type));
        wire::writeU32(buffer, _header.message_id);
        wire::writeU32(buffer, payload_size);

        const auto timestamp_bytes = reinterpret_cast<const std::uint8_t *>(&_header.timestamp);
        buffer.insert(buffer.end(), timestamp_bytes, timestamp_bytes + sizeof(_header.timestamp));
    }

    Status Message::deserializeHeader(const std::vector<std::uint8_t> &data)
    {
        if (data.size() < MessageHeader::HEADER_SIZE)
        {
            return Status::INVALID_REQUEST;
        }

        std::size_t offset = 0;

        std::memcpy(&_header.magic_number, data.data() + offset, sizeof(_header.magic_number));
        offset += sizeof(_header.magic_number);

        _header.version = data[offset];
        offset += sizeof(_header.version);

        _header.type = static_cast<MessageType>(data[offset]);
        offset += sizeof(_header.type);

        std::memcpy(&_header.message_id, data.data() + offset, sizeof(_header.message_id));
        offset += sizeof(_header.message_id);

        std::memcpy(&_header.payload_size, data.data() + offset, sizeof(_header.payload_size));
        offset += sizeof(_header.payload_size);

        std::memcpy(&_header.timestamp, data.data() + offset, sizeof(_header.timestamp));

        if (!_header.isValid())
        {
            return Status::INVALID_REQUEST;
        }

        return Status::OK;
    }

    Result<std::vector<std::uint8_t>> Message::serialize() const
    {
        std::vector<std::uint8_t> payload;
        serializePayload(payload);

        if (payload.size() > MessageHeader::MAX_PAYLOAD_SIZE)
        {
            LOG_ERROR("Payload of %zu bytes exceeds the frame limit for %s",
                      payload.size(), messageTypeToString(getType()).c_str());
            return Result<std::vector<std::uint8_t>>(Status::INVALID_REQUEST);
        }

        std::vector<std::uint8_t> buffer;
        buffer.reserve(MessageHeader::HEADER_SIZE + payload.size());
        serializeHeader(buffer, static_cast<std::uint32_t>(payload.size()));
        buffer.insert(buffer.end(), payload.begin(), payload.end());

        return Result<std::vector<std::uint8_t>>(std::move(buffer));
    }

    Status Message::deserialize(const std::vector<std::uint8_t> &data)
    {
        const auto expected_type = _header.type;

        const auto header_status = deserializeHeader(data);
        if (header_status != Status::OK)
        {
            return header_status;
        }

        if (_header.type != expected_type)
        {
            return Status::INVALID_REQUEST;
        }

        if (data.size() < MessageHeader::HEADER_SIZE + _header.payload_size)
        {
            return Status::INVALID_REQUEST;
        }

        std::size_t offset = MessageHeader::HEADER_SIZE;
        return deserializePayload(data, offset);
    }

    std::unique_ptr<Message> Message::createMessage(MessageType type)
    {
        switch (type)
        {
        case MessageType::PUT_REQUEST:
            return std::make_unique<PutRequestMessage>();
        case MessageType::PUT_RESPONSE:
            return std::make_unique<PutResponseMessage>();
        case MessageType::GET_REQUEST:
            return std::make_unique<GetRequestMessage>();
        case MessageType::GET_RESPONSE:
            return std::make_unique<GetResponseMessage>();
        case MessageType::GET_STATE_REQUEST:
            return std::make_unique<GetStateRequestMessage>();
        case MessageType::GET_STATE_RESPONSE:
            return std::make_unique<GetStateResponseMessage>();
        case MessageType::PING:
            return std::make_unique<PingMessage>();
        case MessageType::PING_RESPONSE:
            return std::make_unique<PingResponseMessage>();
        case MessageType::PUSH_STATE_REQUEST:
            return std::make_unique<PushStateRequestMessage>();
        case MessageType::PUSH_STATE_RESPONSE:
            return std::make_unique<PushStateResponseMessage>();
        case MessageType::PROMOTE_REQUEST:
            return std::make_unique<PromoteRequestMessage>();
        case MessageType::PROMOTE_RESPONSE:
            return std::make_unique<PromoteResponseMessage>();
        case MessageType::REGISTRY_BIND_REQUEST:
            return std::make_unique<RegistryBindRequestMessage>();
        case MessageType::REGISTRY_BIND_RESPONSE:
            return std::make_unique<RegistryBindResponseMessage>();
        case MessageType::REGISTRY_LOOKUP_REQUEST:
            return std::make_unique<RegistryLookupRequestMessage>();
        case MessageType::REGISTRY_LOOKUP_RESPONSE:
            return std::make_unique<RegistryLookupResponseMessage>();
        case MessageType::REGISTRY_LIST_REQUEST:
            return std::make_unique<RegistryListRequestMessage>();
        case MessageType::REGISTRY_LIST_RESPONSE:
            return std::make_unique<RegistryListResponseMessage>();
        case MessageType::ERROR_RESPONSE:
            return std::make_unique<ErrorResponseMessage>();
        default:
            return nullptr;
        }
    }

    Result<std::unique_ptr<Message>> Message::fromBytes(const std::vector<std::uint8_t> &data)
    {
        if (data.size() < MessageHeader::HEADER_SIZE)
        {
            return Result<std::unique_ptr<Message>>(Status::INVALID_REQUEST);
        }

        const auto type = static_cast<MessageType>(data[MessageHeader::TYPE_OFFSET]);

        auto message = createMessage(type);
        if (!message)
        {
            LOG_ERROR("Unknown message type: %d", static_cast<int>(type));
            return Result<std::unique_ptr<Message>>(Status::INVALID_REQUEST);
        }

        const auto status = message->deserialize(data);
        if (status != Status::OK)
        {
            return Result<std::unique_ptr<Message>>(status);
        }

        return Result<std::unique_ptr<Message>>(std::move(message));
    }

    namespace wire
    {
        void writeU8(std::vector<std::uint8_t> &buffer, std::uint8_t value)
        {
            buffer.push_back(value);
        }

        void writeU16(std::vector<std::uint8_t> &buffer, std::uint16_t value)
        {
            const auto bytes = reinterpret_cast<const std::uint8_t *>(&value);
            buffer.insert(buffer.end(), bytes, bytes + sizeof(value));
        }

        void writeU32(std::vector<std::uint8_t> &buffer, std::uint32_t value)
        {
            const auto bytes = reinterpret_cast<const std::uint8_t *>(&value);
            buffer.insert(buffer.end(), bytes, bytes + sizeof(value));
        }

        void writeBool(std::vector<std::uint8_t> &buffer, bool value)
        {
            buffer.push_back(value ? 1 : 0);
        }

        void writeString(std::vector<std::uint8_t> &buffer, const std::string &str)
        {
            writeU32(buffer, static_cast<std::uint32_t>(str.size()));
            buffer.insert(buffer.end(), str.begin(), str.end());
        }

        void writeStatus(std::vector<std::uint8_t> &buffer, Status status)
        {
            buffer.push_back(static_cast<std::uint8_t>(status));
        }

        void writeSnapshot(std::vector<std::uint8_t> &buffer, const Snapshot &snapshot)
        {
            writeU32(buffer, static_cast<std::uint32_t>(snapshot.size()));
            for (const auto &[key, value] : snapshot)
            {
                writeString(buffer, key);
                writeString(buffer, value);
            }
        }

        void writeStringList(std::vector<std::uint8_t> &buffer, const std::vector<std::string> &list)
        {
            writeU32(buffer, static_cast<std::uint32_t>(list.size()));
            for (const auto &item : list)
            {
                writeString(buffer, item);
            }
        }

        Status readU8(const std::vector<std::uint8_t> &data, std::size_t &offset, std::uint8_t &value)
        {
            if (offset + sizeof(value) > data.size())
            {
                return Status::INVALID_REQUEST;
            }
            value = data[offset];
            offset += sizeof(value);
            return Status::OK;
        }

        Status readU16(const std::vector<std::uint8_t> &data, std::size_t &offset, std::uint16_t &value)
        {
            if (offset + sizeof(value) > data.size())
            {
                return Status::INVALID_REQUEST;
            }
            std::memcpy(&value, data.data() + offset, sizeof(value));
            offset += sizeof(value);
            return Status::OK;
        }

        Status readU32(const std::vector<std::uint8_t> &data, std::size_t &offset, std::uint32_t &value)
        {
            if (offset + sizeof(value) > data.size())
            {
                return Status::INVALID_REQUEST;
            }
            std::memcpy(&value, data.data() + offset, sizeof(value));
            offset += sizeof(value);
            return Status::OK;
        }

        Status readBool(const std::vector<std::uint8_t> &data, std::size_t &offset, bool &value)
        {
            std::uint8_t byte = 0;
            const auto status = readU8(data, offset, byte);
            if (status != Status::OK)
            {
                return status;
            }
            if (byte > 1)
            {
                return Status::INVALID_REQUEST;
            }
            value = byte == 1;
            return Status::OK;
        }

        Status readString(const std::vector<std::uint8_t> &data, std::size_t &offset, std::string &str)
        {
            std::uint32_t size = 0;
            const auto status = readU32(data, offset, size);
            if (status != Status::OK)
            {
                return status;
            }

            if (size > data.size() - offset)
            {
                return Status::INVALID_REQUEST;
            }

            str.assign(data.begin() + offset, data.begin() + offset + size);
            offset += size;

            return Status::OK;
        }

        Status readStatus(const std::vector<std::uint8_t> &data, std::size_t &offset, Status &status)
        {
            std::uint8_t byte = 0;
            const auto read_status = readU8(data, offset, byte);
            if (read_status != Status::OK)
            {
                return read_status;
            }
            if (byte > static_cast<std::uint8_t>(Status::UNAVAILABLE))
            {
                return Status::INVALID_REQUEST;
            }
            status = static_cast<Status>(byte);
            return Status::OK;
        }

        Status readSnapshot(const std::vector<std::uint8_t> &data, std::size_t &offset, Snapshot &snapshot)
        {
            std::uint32_t count = 0;
            auto status = readU32(data, offset, count);
            if (status != Status::OK)
            {
                return status;
            }

            Snapshot result;
            for (std::uint32_t i = 0; i < count; ++i)
            {
                std::string key;
                std::string value;
                status = readString(data, offset, key);
                if (status != Status::OK)
                {
                    return status;
                }
                status = readString(data, offset, value);
                if (status != Status::OK)
                {
                    return status;
                }
                result[std::move(key)] = std::move(value);
            }

            snapshot = std::move(result);
            return Status::OK;
        }

        Status readStringList(const std::vector<std::uint8_t> &data, std::size_t &offset, std::vector<std::string> &list)
        {
            std::uint32_t count = 0;
            auto status = readU32(data, offset, count);
            if (status != Status::OK)
            {
                return status;
            }

            std::vector<std::string> result;
            for (std::uint32_t i = 0; i < count; ++i)
            {
                std::string item;
                status = readString(data, offset, item);
                if (status != Status::OK)
                {
                    return status;
                }
                result.push_back(std::move(item));
            }

            list = std::move(result);
            return Status::OK;
        }
    } // namespace wire

    void StatusResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
    }

    Status StatusResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        return wire::readStatus(data, offset, _status);
    }

    void PutRequestMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeString(buffer, _key);
        wire::writeString(buffer, _value);
    }

    Status PutRequestMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        const auto status = wire::readString(data, offset, _key);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readString(data, offset, _value);
    }

    void PutResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
        wire::writeBool(buffer, _accepted);
    }

    Status PutResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        const auto status = wire::readStatus(data, offset, _status);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readBool(data, offset, _accepted);
    }

    void GetRequestMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeString(buffer, _key);
    }

    Status GetRequestMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        return wire::readString(data, offset, _key);
    }

    void GetResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
        wire::writeBool(buffer, _value.has_value());
        if (_value)
        {
            wire::writeString(buffer, *_value);
        }
    }

    Status GetResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        auto status = wire::readStatus(data, offset, _status);
        if (status != Status::OK)
        {
            return status;
        }

        bool found = false;
        status = wire::readBool(data, offset, found);
        if (status != Status::OK)
        {
            return status;
        }

        if (!found)
        {
            _value.reset();
            return Status::OK;
        }

        std::string value;
        status = wire::readString(data, offset, value);
        if (status != Status::OK)
        {
            return status;
        }
        _value = std::move(value);
        return Status::OK;
    }

    void GetStateResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
        wire::writeSnapshot(buffer, _snapshot);
    }

    Status GetStateResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        const auto status = wire::readStatus(data, offset, _status);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readSnapshot(data, offset, _snapshot);
    }

    void PingMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeString(buffer, _sender);
    }

    Status PingMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        return wire::readString(data, offset, _sender);
    }

    void PingResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeString(buffer, _responder);
    }

    Status PingResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        return wire::readString(data, offset, _responder);
    }

    void PushStateRequestMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeSnapshot(buffer, _snapshot);
    }

    Status PushStateRequestMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        return wire::readSnapshot(data, offset, _snapshot);
    }

    void RegistryBindRequestMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeString(buffer, _name);
        wire::writeString(buffer, _address);
        wire::writeU16(buffer, _port);
    }

    Status RegistryBindRequestMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        auto status = wire::readString(data, offset, _name);
        if (status != Status::OK)
        {
            return status;
        }

        status = wire::readString(data, offset, _address);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readU16(data, offset, _port);
    }

    void RegistryLookupRequestMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeString(buffer, _name);
    }

    Status RegistryLookupRequestMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        return wire::readString(data, offset, _name);
    }

    void RegistryLookupResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
        wire::writeString(buffer, _address);
        wire::writeU16(buffer, _port);
    }

    Status RegistryLookupResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        auto status = wire::readStatus(data, offset, _status);
        if (status != Status::OK)
        {
            return status;
        }

        status = wire::readString(data, offset, _address);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readU16(data, offset, _port);
    }

    void RegistryListResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
        wire::writeStringList(buffer, _names);
    }

    Status RegistryListResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        const auto status = wire::readStatus(data, offset, _status);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readStringList(data, offset, _names);
    }

    void ErrorResponseMessage::serializePayload(std::vector<std::uint8_t> &buffer) const
    {
        wire::writeStatus(buffer, _status);
        wire::writeString(buffer, _error_message);
    }

    Status ErrorResponseMessage::deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset)
    {
        const auto status = wire::readStatus(data, offset, _status);
        if (status != Status::OK)
        {
            return status;
        }

        return wire::readString(data, offset, _error_message);
    }
} // namespace passive_kv
