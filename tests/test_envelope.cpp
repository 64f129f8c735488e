// tests/test_envelope.cpp
//
// Envelope validation and serialization.

#include <gtest/gtest.h>

#include <algorithm>

#include "ipc/envelope.hpp"
#include "ipc/errors.hpp"
#include "test_helpers.hpp"

using namespace agentbus::ipc;
using agentbus::tests::envelope_record;
using json = nlohmann::json;

namespace {

json full_record() {
    return {
        {"id", "msg-1"},
        {"correlationId", "task-1"},
        {"traceId", "0af7651916cd43dd8448eb211c80319c"},
        {"spanId", "b7ad6b7169203331"},
        {"sender", "alice"},
        {"recipient", "bob"},
        {"messageType", "TASK_REQUEST"},
        {"payload", {{"taskId", "task-1"}, {"taskType", "echo"}}},
        {"delivery", {{"guarantee", "EXACTLY_ONCE"}, {"retryCount", 1},
                      {"retryDelayMs", 250}, {"requireAck", false}, {"priority", 9}}},
        {"context", {{"traceId", "0af7651916cd43dd8448eb211c80319c"},
                     {"spanId", "b7ad6b7169203331"},
                     {"baggage", {{"tenant", "acme"}}},
                     {"requestId", "task-1"},
                     {"timeoutMs", 5000},
                     {"metadata", {{"source", "test"}}}}},
        {"createdAt", 1700000000000LL},
        {"tags", {"urgent"}},
        {"permissions", {"read"}}
    };
}

bool names_field(const ValidationError& e, const std::string& field) {
    const auto& fields = e.fields();
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

} // namespace

TEST(EnvelopeTest, ValidateParsesEveryField)
{
    Envelope env = validate(full_record());

    EXPECT_EQ(env.id, "msg-1");
    ASSERT_TRUE(env.correlation_id.has_value());
    EXPECT_EQ(*env.correlation_id, "task-1");
    EXPECT_EQ(env.sender, "alice");
    EXPECT_EQ(env.recipient, "bob");
    EXPECT_EQ(env.message_type, MessageType::TASK_REQUEST);
    EXPECT_EQ(env.delivery.guarantee, DeliveryGuarantee::EXACTLY_ONCE);
    EXPECT_EQ(env.delivery.retry_count, 1);
    EXPECT_EQ(env.delivery.retry_delay_ms, 250);
    EXPECT_FALSE(env.delivery.require_ack);
    EXPECT_EQ(env.delivery.priority, 9);
    EXPECT_EQ(env.context.baggage.at("tenant"), "acme");
    EXPECT_EQ(env.context.timeout_ms, 5000);
    EXPECT_EQ(env.created_at_ms, 1700000000000LL);
    EXPECT_EQ(env.tags, std::vector<std::string>{"urgent"});
    EXPECT_EQ(env.permissions, std::vector<std::string>{"read"});
}

TEST(EnvelopeTest, SerializeThenValidateIsStable)
{
    for (const json& raw : {full_record(), envelope_record("m-2", "a", "b")}) {
        Envelope first = validate(raw);
        Envelope second = validate(to_json(first));
        EXPECT_EQ(to_json(first), to_json(second));
    }
}

TEST(EnvelopeTest, DefaultsApplyToMinimalRecord)
{
    Envelope env = validate(envelope_record("m-1", "a", "b"));

    EXPECT_FALSE(env.correlation_id.has_value());
    EXPECT_EQ(env.delivery.guarantee, DeliveryGuarantee::AT_LEAST_ONCE);
    EXPECT_EQ(env.delivery.retry_count, 3);
    EXPECT_EQ(env.delivery.retry_delay_ms, 1000);
    EXPECT_TRUE(env.delivery.require_ack);
    EXPECT_EQ(env.delivery.priority, 5);
    EXPECT_EQ(env.created_at_ms, 0);
    EXPECT_TRUE(env.tags.empty());
}

TEST(EnvelopeTest, MissingRecipientIsNamed)
{
    json raw = envelope_record("m-1", "a", "b");
    raw.erase("recipient");

    try {
        validate(raw);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_TRUE(names_field(e, "recipient"));
        EXPECT_NE(std::string(e.what()).find("recipient"), std::string::npos);
    }
}

TEST(EnvelopeTest, EveryOffendingFieldIsReported)
{
    json raw = envelope_record("", "a", "b");
    raw["messageType"] = "BROADCAST";
    raw["delivery"] = {{"priority", "high"}};
    raw["tags"] = {1, 2};

    try {
        validate(raw);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_TRUE(names_field(e, "id"));
        EXPECT_TRUE(names_field(e, "messageType"));
        EXPECT_TRUE(names_field(e, "delivery.priority"));
        EXPECT_TRUE(names_field(e, "tags"));
        EXPECT_FALSE(names_field(e, "sender"));
    }
}

TEST(EnvelopeTest, NonObjectIsRejected)
{
    EXPECT_THROW(validate(json::array({1, 2})), ValidationError);
    EXPECT_THROW(validate(json("text")), ValidationError);
}

TEST(EnvelopeTest, UnknownFieldsSurviveAsExtensions)
{
    json raw = envelope_record("m-1", "a", "b");
    raw["routingHint"] = {{"zone", "eu"}};

    Envelope env = validate(raw);
    ASSERT_TRUE(env.extensions.contains("routingHint"));
    EXPECT_EQ(to_json(env)["routingHint"]["zone"], "eu");
}

TEST(EnvelopeTest, CheckRejectsEnvelopesBuiltWithoutSender)
{
    Envelope env = make_envelope(MessageType::TASK_REQUEST, "", "bob", json::object());
    EXPECT_THROW(check(env), ValidationError);

    env.sender = "alice";
    EXPECT_NO_THROW(check(env));
}

TEST(EnvelopeTest, MakeEnvelopeAssignsFreshIds)
{
    Envelope a = make_envelope(MessageType::TASK_REQUEST, "alice", "bob", json::object());
    Envelope b = make_envelope(MessageType::TASK_REQUEST, "alice", "bob", json::object());

    EXPECT_EQ(a.id.size(), 36u);
    EXPECT_EQ(a.id[14], '4');
    EXPECT_EQ(a.trace_id.size(), 32u);
    EXPECT_EQ(a.span_id.size(), 16u);
    EXPECT_EQ(a.context.trace_id, a.trace_id);
    EXPECT_GT(a.created_at_ms, 0);
    EXPECT_NE(a.id, b.id);
    EXPECT_NE(a.trace_id, b.trace_id);
}

TEST(EnvelopeTest, ControlTypesAreRecognised)
{
    EXPECT_TRUE(is_control_type(MessageType::HELLO));
    EXPECT_TRUE(is_control_type(MessageType::PONG));
    EXPECT_FALSE(is_control_type(MessageType::TASK_REQUEST));
    EXPECT_FALSE(is_control_type(MessageType::TASK_RESPONSE));
    EXPECT_EQ(message_type_from_string("TASK_RESPONSE"), MessageType::TASK_RESPONSE);
    EXPECT_FALSE(message_type_from_string("task_response").has_value());
}
