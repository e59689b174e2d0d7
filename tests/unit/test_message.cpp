#include <gtest/gtest.h>
#include "network/message.hpp"
#include <cstring>

using namespace passive_kv;

class MessageTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}

    template <typename T>
    static std::unique_ptr<T> roundTrip(const Message &message)
    {
        const auto serialized = message.serialize();
        EXPECT_TRUE(serialized.ok());
        if (!serialized.ok())
        {
            return nullptr;
        }

        auto decoded = std::make_unique<T>();
        EXPECT_EQ(decoded->deserialize(serialized.value()), Status::OK);
        return decoded;
    }
};

TEST_F(MessageTest, MessageHeaderValidation)
{
    MessageHeader header(MessageType::GET_REQUEST, 123, 456);

    EXPECT_TRUE(header.isValid());
    EXPECT_EQ(header.magic_number, MessageHeader::MAGIC_NUMBER);
    EXPECT_EQ(header.version, MessageHeader::VERSION);
    EXPECT_EQ(header.type, MessageType::GET_REQUEST);
    EXPECT_EQ(header.message_id, 123u);
    EXPECT_EQ(header.payload_size, 456u);
    EXPECT_GT(header.timestamp, 0u);

    header.payload_size = MessageHeader::MAX_PAYLOAD_SIZE + 1;
    EXPECT_FALSE(header.isValid());
}

TEST_F(MessageTest, HeaderLayout)
{
    PutRequestMessage request("key", "value");
    const auto serialized = request.serialize();
    ASSERT_TRUE(serialized.ok());
    const auto &data = serialized.value();

    EXPECT_EQ(MessageHeader::HEADER_SIZE, 22u);
    ASSERT_GT(data.size(), MessageHeader::HEADER_SIZE);
    EXPECT_EQ(data[MessageHeader::TYPE_OFFSET], static_cast<std::uint8_t>(MessageType::PUT_REQUEST));

    std::uint32_t payload_size = 0;
    std::memcpy(&payload_size, data.data() + MessageHeader::PAYLOAD_SIZE_OFFSET, sizeof(payload_size));
    EXPECT_EQ(payload_size, data.size() - MessageHeader::HEADER_SIZE);
}

TEST_F(MessageTest, PutRequestSerialization)
{
    const PutRequestMessage request("test_key", "test_value");

    const auto deserialized = roundTrip<PutRequestMessage>(request);
    ASSERT_NE(deserialized, nullptr);
    EXPECT_EQ(deserialized->getKey(), "test_key");
    EXPECT_EQ(deserialized->getValue(), "test_value");
    EXPECT_EQ(deserialized->getMessageId(), request.getMessageId());
    EXPECT_EQ(deserialized->getType(), MessageType::PUT_REQUEST);
}

TEST_F(MessageTest, PutResponseCarriesAcceptance)
{
    const auto accepted = roundTrip<PutResponseMessage>(PutResponseMessage(456, Status::OK, true));
    ASSERT_NE(accepted, nullptr);
    EXPECT_EQ(accepted->getMessageId(), 456u);
    EXPECT_EQ(accepted->getStatus(), Status::OK);
    EXPECT_TRUE(accepted->isAccepted());

    // A backup answers OK but does not accept the write
    const auto rejected = roundTrip<PutResponseMessage>(PutResponseMessage(457, Status::OK, false));
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->getStatus(), Status::OK);
    EXPECT_FALSE(rejected->isAccepted());
}

TEST_F(MessageTest, GetResponseDistinguishesEmptyFromMissing)
{
    const auto found = roundTrip<GetResponseMessage>(GetResponseMessage(123, Status::OK, Value("test_value")));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->getMessageId(), 123u);
    EXPECT_TRUE(found->isFound());
    EXPECT_EQ(found->getValue(), std::optional<Value>("test_value"));

    const auto empty = roundTrip<GetResponseMessage>(GetResponseMessage(124, Status::OK, Value()));
    ASSERT_NE(empty, nullptr);
    EXPECT_TRUE(empty->isFound());
    EXPECT_TRUE(empty->getValue()->empty());

    const auto missing = roundTrip<GetResponseMessage>(GetResponseMessage(125, Status::OK));
    ASSERT_NE(missing, nullptr);
    EXPECT_FALSE(missing->isFound());

    const auto unavailable = roundTrip<GetResponseMessage>(GetResponseMessage(126, Status::UNAVAILABLE));
    ASSERT_NE(unavailable, nullptr);
    EXPECT_EQ(unavailable->getStatus(), Status::UNAVAILABLE);
}

TEST_F(MessageTest, SnapshotMessages)
{
    const Snapshot snapshot{{"a", "1"}, {"b", ""}, {"c", std::string(5000, 'x')}};

    const auto push = roundTrip<PushStateRequestMessage>(PushStateRequestMessage(snapshot));
    ASSERT_NE(push, nullptr);
    EXPECT_EQ(push->getSnapshot(), snapshot);

    const auto state = roundTrip<GetStateResponseMessage>(GetStateResponseMessage(77, Status::OK, snapshot));
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->getMessageId(), 77u);
    EXPECT_EQ(state->getSnapshot(), snapshot);

    const auto empty = roundTrip<PushStateRequestMessage>(PushStateRequestMessage(Snapshot{}));
    ASSERT_NE(empty, nullptr);
    EXPECT_TRUE(empty->getSnapshot().empty());
}

TEST_F(MessageTest, ControlMessages)
{
    const auto ping = roundTrip<PingMessage>(PingMessage("dispatcher"));
    ASSERT_NE(ping, nullptr);
    EXPECT_EQ(ping->getSender(), "dispatcher");

    const auto pong = roundTrip<PingResponseMessage>(PingResponseMessage(9, "replica2"));
    ASSERT_NE(pong, nullptr);
    EXPECT_EQ(pong->getMessageId(), 9u);
    EXPECT_EQ(pong->getResponder(), "replica2");

    const auto promoted = roundTrip<PromoteResponseMessage>(PromoteResponseMessage(10, Status::INTERNAL_ERROR));
    ASSERT_NE(promoted, nullptr);
    EXPECT_EQ(promoted->getStatus(), Status::INTERNAL_ERROR);

    const auto pushed = roundTrip<PushStateResponseMessage>(PushStateResponseMessage(11, Status::OK));
    ASSERT_NE(pushed, nullptr);
    EXPECT_EQ(pushed->getStatus(), Status::OK);
    EXPECT_EQ(pushed->getType(), MessageType::PUSH_STATE_RESPONSE);
}

TEST_F(MessageTest, RegistryMessages)
{
    const auto bind = roundTrip<RegistryBindRequestMessage>(RegistryBindRequestMessage("replica1", "10.0.0.5", 9001));
    ASSERT_NE(bind, nullptr);
    EXPECT_EQ(bind->getName(), "replica1");
    EXPECT_EQ(bind->getAddress(), "10.0.0.5");
    EXPECT_EQ(bind->getPort(), 9001);

    const auto lookup = roundTrip<RegistryLookupResponseMessage>(
        RegistryLookupResponseMessage(5, Status::OK, "127.0.0.1", 9002));
    ASSERT_NE(lookup, nullptr);
    EXPECT_EQ(lookup->getAddress(), "127.0.0.1");
    EXPECT_EQ(lookup->getPort(), 9002);

    const std::vector<std::string> names = {"replica1", "replica2", "replica3"};
    const auto list = roundTrip<RegistryListResponseMessage>(RegistryListResponseMessage(6, Status::OK, names));
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->getNames(), names);
}

TEST_F(MessageTest, ErrorResponseSerialization)
{
    const ErrorResponseMessage error(111, Status::TIMEOUT, "Connection timed out");

    const auto deserialized = roundTrip<ErrorResponseMessage>(error);
    ASSERT_NE(deserialized, nullptr);
    EXPECT_EQ(deserialized->getMessageId(), 111u);
    EXPECT_EQ(deserialized->getStatus(), Status::TIMEOUT);
    EXPECT_EQ(deserialized->getErrorMessage(), "Connection timed out");
    EXPECT_EQ(deserialized->getType(), MessageType::ERROR_RESPONSE);
}

TEST_F(MessageTest, MessageFactory)
{
    const MessageType known[] = {
        MessageType::PUT_REQUEST, MessageType::GET_REQUEST, MessageType::GET_STATE_REQUEST,
        MessageType::PUT_RESPONSE, MessageType::GET_RESPONSE, MessageType::GET_STATE_RESPONSE,
        MessageType::PING, MessageType::PING_RESPONSE, MessageType::PUSH_STATE_REQUEST,
        MessageType::PUSH_STATE_RESPONSE, MessageType::PROMOTE_REQUEST, MessageType::PROMOTE_RESPONSE,
        MessageType::REGISTRY_BIND_REQUEST, MessageType::REGISTRY_BIND_RESPONSE,
        MessageType::REGISTRY_LOOKUP_REQUEST, MessageType::REGISTRY_LOOKUP_RESPONSE,
        MessageType::REGISTRY_LIST_REQUEST, MessageType::REGISTRY_LIST_RESPONSE,
        MessageType::ERROR_RESPONSE};

    for (const auto type : known)
    {
        auto message = Message::createMessage(type);
        ASSERT_NE(message, nullptr) << messageTypeToString(type);
        EXPECT_EQ(message->getType(), type);
    }

    EXPECT_EQ(Message::createMessage(static_cast<MessageType>(255)), nullptr);
}

TEST_F(MessageTest, MessageFromBytes)
{
    const GetRequestMessage original("test_key_from_bytes");
    const auto serialized_result = original.serialize();
    ASSERT_TRUE(serialized_result.ok());

    const auto reconstructed_result = Message::fromBytes(serialized_result.value());
    ASSERT_TRUE(reconstructed_result.ok());

    const auto &reconstructed = reconstructed_result.value();
    EXPECT_EQ(reconstructed->getType(), MessageType::GET_REQUEST);
    EXPECT_EQ(reconstructed->getMessageId(), original.getMessageId());

    const auto &get_msg = static_cast<const GetRequestMessage &>(*reconstructed);
    EXPECT_EQ(get_msg.getKey(), "test_key_from_bytes");
}

TEST_F(MessageTest, DeserializeRejectsWrongType)
{
    const auto serialized = GetRequestMessage("key").serialize();
    ASSERT_TRUE(serialized.ok());

    PutRequestMessage put;
    EXPECT_EQ(put.deserialize(serialized.value()), Status::INVALID_REQUEST);
}

TEST_F(MessageTest, InvalidMessageDeserialization)
{
    const std::vector<std::uint8_t> invalid_data = {1, 2, 3, 4, 5};

    GetRequestMessage msg;
    EXPECT_NE(msg.deserialize(invalid_data), Status::OK);
    EXPECT_FALSE(Message::fromBytes(invalid_data).ok());
}

TEST_F(MessageTest, RejectsCorruptFrames)
{
    const auto serialized = PutRequestMessage("key", "value").serialize();
    ASSERT_TRUE(serialized.ok());

    // Bad magic
    auto bad_magic = serialized.value();
    bad_magic[0] ^= 0xFF;
    EXPECT_EQ(Message::fromBytes(bad_magic).status(), Status::INVALID_REQUEST);

    // Unknown type
    auto bad_type = serialized.value();
    bad_type[MessageHeader::TYPE_OFFSET] = 200;
    EXPECT_EQ(Message::fromBytes(bad_type).status(), Status::INVALID_REQUEST);

    // Truncated payload
    auto truncated = serialized.value();
    truncated.pop_back();
    EXPECT_EQ(Message::fromBytes(truncated).status(), Status::INVALID_REQUEST);

    // Oversized payload announced in the header
    auto oversized = serialized.value();
    const std::uint32_t too_big = MessageHeader::MAX_PAYLOAD_SIZE + 1;
    std::memcpy(oversized.data() + MessageHeader::PAYLOAD_SIZE_OFFSET, &too_big, sizeof(too_big));
    EXPECT_EQ(Message::fromBytes(oversized).status(), Status::INVALID_REQUEST);
}

TEST_F(MessageTest, RejectsOutOfRangeFields)
{
    const auto serialized = PutResponseMessage(1, Status::OK, true).serialize();
    ASSERT_TRUE(serialized.ok());

    // Payload is status byte then accepted byte
    auto bad_status = serialized.value();
    bad_status[MessageHeader::HEADER_SIZE] = 42;
    EXPECT_FALSE(Message::fromBytes(bad_status).ok());

    auto bad_bool = serialized.value();
    bad_bool[MessageHeader::HEADER_SIZE + 1] = 7;
    EXPECT_FALSE(Message::fromBytes(bad_bool).ok());
}

TEST_F(MessageTest, EmptyValues)
{
    const auto empty_key = roundTrip<GetRequestMessage>(GetRequestMessage(""));
    ASSERT_NE(empty_key, nullptr);
    EXPECT_TRUE(empty_key->getKey().empty());

    const auto empty_value = roundTrip<PutRequestMessage>(PutRequestMessage("key", ""));
    ASSERT_NE(empty_value, nullptr);
    EXPECT_EQ(empty_value->getKey(), "key");
    EXPECT_TRUE(empty_value->getValue().empty());
}

TEST_F(MessageTest, LargeMessages)
{
    const std::string large_key(1000, 'k');
    const std::string large_value(2 * 1024 * 1024, 'v');

    const auto deserialized = roundTrip<PutRequestMessage>(PutRequestMessage(large_key, large_value));
    ASSERT_NE(deserialized, nullptr);
    EXPECT_EQ(deserialized->getKey(), large_key);
    EXPECT_EQ(deserialized->getValue(), large_value);
}

TEST_F(MessageTest, UtilityFunctions)
{
    EXPECT_EQ(messageTypeToString(MessageType::GET_REQUEST), "GET_REQUEST");
    EXPECT_EQ(messageTypeToString(MessageType::PUT_RESPONSE), "PUT_RESPONSE");
    EXPECT_EQ(messageTypeToString(MessageType::PROMOTE_REQUEST), "PROMOTE_REQUEST");
    EXPECT_EQ(messageTypeToString(static_cast<MessageType>(255)), "UNKNOWN(255)");
}

TEST_F(MessageTest, MessageIdGeneration)
{
    const GetRequestMessage msg1("key1");
    const GetRequestMessage msg2("key2");

    EXPECT_NE(msg1.getMessageId(), msg2.getMessageId());
    EXPECT_GT(msg1.getMessageId(), 0u);
    EXPECT_GT(msg2.getMessageId(), 0u);
}
