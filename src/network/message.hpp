#ifndef __MESSAGE_HPP__
#define __MESSAGE_HPP__

#include "../common/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace passive_kv
{
    enum class MessageType : std::uint8_t
    {
        // Client operations (dispatcher front door and replica client-op surface)
        PUT_REQUEST = 1,
        GET_REQUEST = 2,
        GET_STATE_REQUEST = 3,

        PUT_RESPONSE = 10,
        GET_RESPONSE = 11,
        GET_STATE_RESPONSE = 12,

        // Replica control surface
        PING = 20,
        PING_RESPONSE = 21,
        PUSH_STATE_REQUEST = 22,
        PUSH_STATE_RESPONSE = 23,
        PROMOTE_REQUEST = 24,
        PROMOTE_RESPONSE = 25,

        // Registry
        REGISTRY_BIND_REQUEST = 30,
        REGISTRY_BIND_RESPONSE = 31,
        REGISTRY_LOOKUP_REQUEST = 32,
        REGISTRY_LOOKUP_RESPONSE = 33,
        REGISTRY_LIST_REQUEST = 34,
        REGISTRY_LIST_RESPONSE = 35,

        // Error responses
        ERROR_RESPONSE = 99
    };

    [[nodiscard]] std::string messageTypeToString(MessageType type);

    struct MessageHeader
    {
        std::uint32_t magic_number; // for protocol validation
        std::uint8_t version;
        MessageType type;
        std::uint32_t message_id;
        std::uint32_t payload_size;
        std::uint64_t timestamp;

        MessageHeader() = default;
        MessageHeader(MessageType type, std::uint32_t message_id, uint32_t payload_size);

        [[nodiscard]] bool isValid() const noexcept;

        static constexpr std::uint32_t MAGIC_NUMBER = 0x4B565250;
        static constexpr std::uint8_t VERSION = 1;
        static constexpr std::size_t HEADER_SIZE = sizeof(std::uint32_t) + // magic
                                                   sizeof(std::uint8_t) +  // version
                                                   sizeof(MessageType) +   // type
                                                   sizeof(std::uint32_t) + // message_id
                                                   sizeof(std::uint32_t) + // payload_size
                                                   sizeof(std::uint64_t);  // timestamp
        static constexpr std::size_t TYPE_OFFSET = sizeof(std::uint32_t) + sizeof(std::uint8_t);
        static constexpr std::size_t PAYLOAD_SIZE_OFFSET = TYPE_OFFSET + sizeof(MessageType) + sizeof(std::uint32_t);
        static constexpr std::uint32_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;
    };

    class Message
    {
    public:
        explicit Message(MessageType type);
        Message(MessageType type, std::uint32_t message_id);
        virtual ~Message() = default;

        Message(const Message &) = delete;
        Message &operator=(const Message &) = delete;
        Message(Message &&) = default;
        Message &operator=(Message &&) = default;

        [[nodiscard]] MessageType getType() const noexcept { return _header.type; }
        [[nodiscard]] std::uint32_t getMessageId() const noexcept { return _header.message_id; }
        [[nodiscard]] std::uint32_t getPayloadSize() const noexcept { return _header.payload_size; }
        [[nodiscard]] std::uint64_t getTimestamp() const noexcept { return _header.timestamp; }

        [[nodiscard]] Result<std::vector<std::uint8_t>> serialize() const;
        [[nodiscard]] Status deserialize(const std::vector<std::uint8_t> &data);

        // Factory method
        [[nodiscard]] static std::unique_ptr<Message> createMessage(MessageType type);
        [[nodiscard]] static Result<std::unique_ptr<Message>> fromBytes(const std::vector<std::uint8_t> &data);

    protected:
        MessageHeader _header;

        virtual void serializePayload(std::vector<std::uint8_t> &buffer) const = 0;
        [[nodiscard]] virtual Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) = 0;

        [[nodiscard]] static std::uint32_t generateMessageId() noexcept;

    private:
        void serializeHeader(std::vector<std::uint8_t> &buffer, std::uint32_t payload_size) const;
        [[nodiscard]] Status deserializeHeader(const std::vector<std::uint8_t> &data);
    };

    // Primitive encoders shared by messages and registry entries
    namespace wire
    {
        void writeU8(std::vector<std::uint8_t> &buffer, std::uint8_t value);
        void writeU16(std::vector<std::uint8_t> &buffer, std::uint16_t value);
        void writeU32(std::vector<std::uint8_t> &buffer, std::uint32_t value);
        void writeBool(std::vector<std::uint8_t> &buffer, bool value);
        void writeString(std::vector<std::uint8_t> &buffer, const std::string &str);
        void writeStatus(std::vector<std::uint8_t> &buffer, Status status);
        void writeSnapshot(std::vector<std::uint8_t> &buffer, const Snapshot &snapshot);
        void writeStringList(std::vector<std::uint8_t> &buffer, const std::vector<std::string> &list);

        [[nodiscard]] Status readU8(const std::vector<std::uint8_t> &data, std::size_t &offset, std::uint8_t &value);
        [[nodiscard]] Status readU16(const std::vector<std::uint8_t> &data, std::size_t &offset, std::uint16_t &value);
        [[nodiscard]] Status readU32(const std::vector<std::uint8_t> &data, std::size_t &offset, std::uint32_t &value);
        [[nodiscard]] Status readBool(const std::vector<std::uint8_t> &data, std::size_t &offset, bool &value);
        [[nodiscard]] Status readString(const std::vector<std::uint8_t> &data, std::size_t &offset, std::string &str);
        [[nodiscard]] Status readStatus(const std::vector<std::uint8_t> &data, std::size_t &offset, Status &status);
        [[nodiscard]] Status readSnapshot(const std::vector<std::uint8_t> &data, std::size_t &offset, Snapshot &snapshot);
        [[nodiscard]] Status readStringList(const std::vector<std::uint8_t> &data, std::size_t &offset, std::vector<std::string> &list);
    } // namespace wire

    // Messages with no payload
    class EmptyMessage : public Message
    {
    public:
        using Message::Message;

    protected:
        void serializePayload(std::vector<std::uint8_t> &) const override {}
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &, std::size_t &) override { return Status::OK; }
    };

    // Responses that only carry a status
    class StatusResponseMessage : public Message
    {
    public:
        explicit StatusResponseMessage(MessageType type) : Message(type) {}
        StatusResponseMessage(MessageType type, std::uint32_t request_id, Status status)
            : Message(type, request_id), _status(status) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::OK;
    };

    class PutRequestMessage : public Message
    {
    public:
        PutRequestMessage() : Message(MessageType::PUT_REQUEST) {}
        PutRequestMessage(Key key, Value value)
            : Message(MessageType::PUT_REQUEST), _key(std::move(key)), _value(std::move(value)) {}

        [[nodiscard]] const Key &getKey() const noexcept { return _key; }
        [[nodiscard]] const Value &getValue() const noexcept { return _value; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Key _key;
        Value _value;
    };

    class PutResponseMessage : public Message
    {
    public:
        PutResponseMessage() : Message(MessageType::PUT_RESPONSE) {}
        PutResponseMessage(std::uint32_t request_id, Status status, bool accepted = false)
            : Message(MessageType::PUT_RESPONSE, request_id), _status(status), _accepted(accepted) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }
        // Application-level outcome; false when the target replica is not primary
        [[nodiscard]] bool isAccepted() const noexcept { return _accepted; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::OK;
        bool _accepted = false;
    };

    class GetRequestMessage : public Message
    {
    public:
        GetRequestMessage() : Message(MessageType::GET_REQUEST)
        {
        }
        explicit GetRequestMessage(Key key) : Message(MessageType::GET_REQUEST), _key(std::move(key))
        {
        }

        [[nodiscard]] const Key &getKey() const noexcept { return _key; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Key _key;
    };

    class GetResponseMessage : public Message
    {
    public:
        GetResponseMessage() : Message(MessageType::GET_RESPONSE) {}
        GetResponseMessage(std::uint32_t request_id, Status status, std::optional<Value> value = std::nullopt)
            : Message(MessageType::GET_RESPONSE, request_id), _status(status), _value(std::move(value)) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }
        [[nodiscard]] bool isFound() const noexcept { return _value.has_value(); }
        [[nodiscard]] const std::optional<Value> &getValue() const noexcept { return _value; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::OK;
        std::optional<Value> _value;
    };

    class GetStateRequestMessage : public EmptyMessage
    {
    public:
        GetStateRequestMessage() : EmptyMessage(MessageType::GET_STATE_REQUEST) {}
    };

    class GetStateResponseMessage : public Message
    {
    public:
        GetStateResponseMessage() : Message(MessageType::GET_STATE_RESPONSE) {}
        GetStateResponseMessage(std::uint32_t request_id, Status status, Snapshot snapshot = {})
            : Message(MessageType::GET_STATE_RESPONSE, request_id), _status(status), _snapshot(std::move(snapshot)) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }
        [[nodiscard]] const Snapshot &getSnapshot() const noexcept { return _snapshot; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::OK;
        Snapshot _snapshot;
    };

    class PingMessage : public Message
    {
    public:
        PingMessage() : Message(MessageType::PING) {}
        explicit PingMessage(std::string sender) : Message(MessageType::PING), _sender(std::move(sender)) {}

        [[nodiscard]] const std::string &getSender() const noexcept { return _sender; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        std::string _sender;
    };

    class PingResponseMessage : public Message
    {
    public:
        PingResponseMessage() : Message(MessageType::PING_RESPONSE) {}
        PingResponseMessage(std::uint32_t request_id, std::string responder)
            : Message(MessageType::PING_RESPONSE, request_id), _responder(std::move(responder)) {}

        [[nodiscard]] const std::string &getResponder() const noexcept { return _responder; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        std::string _responder;
    };

    class PushStateRequestMessage : public Message
    {
    public:
        PushStateRequestMessage() : Message(MessageType::PUSH_STATE_REQUEST) {}
        explicit PushStateRequestMessage(Snapshot snapshot)
            : Message(MessageType::PUSH_STATE_REQUEST), _snapshot(std::move(snapshot)) {}

        [[nodiscard]] const Snapshot &getSnapshot() const noexcept { return _snapshot; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Snapshot _snapshot;
    };

    class PushStateResponseMessage : public StatusResponseMessage
    {
    public:
        PushStateResponseMessage() : StatusResponseMessage(MessageType::PUSH_STATE_RESPONSE) {}
        PushStateResponseMessage(std::uint32_t request_id, Status status)
            : StatusResponseMessage(MessageType::PUSH_STATE_RESPONSE, request_id, status) {}
    };

    class PromoteRequestMessage : public EmptyMessage
    {
    public:
        PromoteRequestMessage() : EmptyMessage(MessageType::PROMOTE_REQUEST) {}
    };

    class PromoteResponseMessage : public StatusResponseMessage
    {
    public:
        PromoteResponseMessage() : StatusResponseMessage(MessageType::PROMOTE_RESPONSE) {}
        PromoteResponseMessage(std::uint32_t request_id, Status status)
            : StatusResponseMessage(MessageType::PROMOTE_RESPONSE, request_id, status) {}
    };

    class RegistryBindRequestMessage : public Message
    {
    public:
        RegistryBindRequestMessage() : Message(MessageType::REGISTRY_BIND_REQUEST) {}
        RegistryBindRequestMessage(std::string name, std::string address, Port port)
            : Message(MessageType::REGISTRY_BIND_REQUEST), _name(std::move(name)),
              _address(std::move(address)), _port(port) {}

        [[nodiscard]] const std::string &getName() const noexcept { return _name; }
        [[nodiscard]] const std::string &getAddress() const noexcept { return _address; }
        [[nodiscard]] Port getPort() const noexcept { return _port; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        std::string _name;
        std::string _address;
        Port _port = 0;
    };

    class RegistryBindResponseMessage : public StatusResponseMessage
    {
    public:
        RegistryBindResponseMessage() : StatusResponseMessage(MessageType::REGISTRY_BIND_RESPONSE) {}
        RegistryBindResponseMessage(std::uint32_t request_id, Status status)
            : StatusResponseMessage(MessageType::REGISTRY_BIND_RESPONSE, request_id, status) {}
    };

    class RegistryLookupRequestMessage : public Message
    {
    public:
        RegistryLookupRequestMessage() : Message(MessageType::REGISTRY_LOOKUP_REQUEST) {}
        explicit RegistryLookupRequestMessage(std::string name)
            : Message(MessageType::REGISTRY_LOOKUP_REQUEST), _name(std::move(name)) {}

        [[nodiscard]] const std::string &getName() const noexcept { return _name; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        std::string _name;
    };

    class RegistryLookupResponseMessage : public Message
    {
    public:
        RegistryLookupResponseMessage() : Message(MessageType::REGISTRY_LOOKUP_RESPONSE) {}
        RegistryLookupResponseMessage(std::uint32_t request_id, Status status,
                                      std::string address = {}, Port port = 0)
            : Message(MessageType::REGISTRY_LOOKUP_RESPONSE, request_id), _status(status),
              _address(std::move(address)), _port(port) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }
        [[nodiscard]] const std::string &getAddress() const noexcept { return _address; }
        [[nodiscard]] Port getPort() const noexcept { return _port; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::OK;
        std::string _address;
        Port _port = 0;
    };

    class RegistryListRequestMessage : public EmptyMessage
    {
    public:
        RegistryListRequestMessage() : EmptyMessage(MessageType::REGISTRY_LIST_REQUEST) {}
    };

    class RegistryListResponseMessage : public Message
    {
    public:
        RegistryListResponseMessage() : Message(MessageType::REGISTRY_LIST_RESPONSE) {}
        RegistryListResponseMessage(std::uint32_t request_id, Status status, std::vector<std::string> names = {})
            : Message(MessageType::REGISTRY_LIST_RESPONSE, request_id), _status(status), _names(std::move(names)) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }
        [[nodiscard]] const std::vector<std::string> &getNames() const noexcept { return _names; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::OK;
        std::vector<std::string> _names;
    };

    class ErrorResponseMessage : public Message
    {
    public:
        ErrorResponseMessage() : Message(MessageType::ERROR_RESPONSE) {}
        ErrorResponseMessage(std::uint32_t request_id, Status status, std::string error_message)
            : Message(MessageType::ERROR_RESPONSE, request_id), _status(status),
              _error_message(std::move(error_message)) {}

        [[nodiscard]] Status getStatus() const noexcept { return _status; }
        [[nodiscard]] const std::string &getErrorMessage() const noexcept { return _error_message; }

    protected:
        void serializePayload(std::vector<std::uint8_t> &buffer) const override;
        [[nodiscard]] Status deserializePayload(const std::vector<std::uint8_t> &data, std::size_t &offset) override;

    private:
        Status _status = Status::INTERNAL_ERROR;
        std::string _error_message;
    };
} // namespace passive_kv

#endif // __MESSAGE_HPP__
