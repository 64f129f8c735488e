// tests/test_legacy_bridge.cpp

#include <gtest/gtest.h>

#include <stdexcept>

#include "ipc/errors.hpp"
#include "ipc/in_process_transport.hpp"
#include "kernel/reactor.hpp"
#include "kernel/task_correlator.hpp"
#include "metrics/metrics.hpp"
#include "services/bridge/legacy_bridge.hpp"
#include "test_helpers.hpp"

using namespace agentbus::ipc;
using namespace agentbus::services::bridge;
using agentbus::kernel::Reactor;
using agentbus::kernel::TaskCorrelator;
using agentbus::metrics::MetricsCollector;
using json = nlohmann::json;

TEST(LegacyBridgeFormat, StatusCodesFollowTaskStatus)
{
    EXPECT_EQ(http_status_for(TaskStatus::COMPLETED), 200);
    EXPECT_EQ(http_status_for(TaskStatus::FAILED), 500);
    EXPECT_EQ(http_status_for(TaskStatus::TIMEOUT), 408);
    EXPECT_EQ(http_status_for(TaskStatus::CANCELLED), 499);
}

TEST(LegacyBridgeFormat, BuildRequestFillsDefaults)
{
    TaskRequest request = build_request({{"taskType", "summarize"}});
    EXPECT_FALSE(request.task_id.empty());
    EXPECT_EQ(request.task_type, "summarize");
    EXPECT_TRUE(request.parameters.is_object());
    EXPECT_TRUE(request.parameters.empty());

    TaskRequest other = build_request({{"taskType", "summarize"}, {"taskId", ""}});
    EXPECT_FALSE(other.task_id.empty());
    EXPECT_NE(other.task_id, request.task_id);

    TaskRequest explicit_id = build_request({{"taskType", "summarize"}, {"taskId", "t-9"},
                                             {"parameters", {{"text", "hello"}}}});
    EXPECT_EQ(explicit_id.task_id, "t-9");
    EXPECT_EQ(explicit_id.parameters["text"], "hello");
}

TEST(LegacyBridgeFormat, BuildRequestRejectsMissingType)
{
    try {
        build_request({{"taskId", "t-1"}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.fields(), std::vector<std::string>{"taskType"});
    }
    EXPECT_THROW(build_request(json::array()), ValidationError);
}

TEST(LegacyBridgeFormat, FailuresMapToHttpReplies)
{
    HttpReply timeout = format_failure("t-1",
        std::make_exception_ptr(TaskTimeoutError("t-1", 100)));
    EXPECT_EQ(timeout.status, 408);
    EXPECT_EQ(timeout.body["taskId"], "t-1");
    EXPECT_EQ(timeout.body["status"], "TIMEOUT");
    EXPECT_EQ(timeout.body["errorCode"], "TIMEOUT");

    HttpReply cancelled = format_failure("t-1",
        std::make_exception_ptr(TaskCancelledError("t-1")));
    EXPECT_EQ(cancelled.status, 499);
    EXPECT_EQ(cancelled.body["status"], "CANCELLED");

    HttpReply invalid = format_failure("t-1",
        std::make_exception_ptr(ValidationError({"taskType"})));
    EXPECT_EQ(invalid.status, 400);
    EXPECT_EQ(invalid.body["error"], "invalid_request");
    EXPECT_EQ(invalid.body["fields"][0], "taskType");

    HttpReply internal = format_failure("t-1",
        std::make_exception_ptr(std::runtime_error("disk on fire")));
    EXPECT_EQ(internal.status, 500);
    EXPECT_EQ(internal.body["errorCode"], "INTERNAL_ERROR");
    EXPECT_EQ(internal.body["errorMessage"], "disk on fire");
}

TEST(LegacyBridgeFormat, FailedTaskIsServerError)
{
    HttpReply reply = format_response(TaskResponse::failed("t-1", "TASK_FAILED", "nope"));
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body["errorCode"], "TASK_FAILED");
}

class LegacyBridgeTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(reactor.init()); }

    Reactor reactor;
    MetricsCollector metrics;
    InProcessTransport bus{metrics};
};

TEST_F(LegacyBridgeTest, SubmitAndCollectThroughTheBus)
{
    bus.subscribe("summarizer", [this](const Envelope& env) {
        TaskRequest request = TaskRequest::from_json(env.payload);
        bus.send(make_task_response_envelope(env, "summarizer",
            TaskResponse::completed(request.task_id,
                {{"summary", request.parameters["text"].get<std::string>().substr(0, 5)}})));
    });

    TaskCorrelator correlator(bus, reactor, metrics);
    LegacyBridge bridge(correlator, "legacy-api", 1000);

    PendingCall call = bridge.submit({{"taskType", "summarize"},
                                      {"parameters", {{"text", "hello world"}}}}, "summarizer");
    EXPECT_FALSE(call.task_id.empty());

    HttpReply reply = bridge.collect(call);
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["taskId"], call.task_id);
    EXPECT_EQ(reply.body["result"]["summary"], "hello");
}

TEST_F(LegacyBridgeTest, UnansweredCallBecomesTimeoutReply)
{
    TaskCorrelator correlator(bus, reactor, metrics);
    LegacyBridge bridge(correlator, "legacy-api", 20);

    PendingCall call = bridge.submit({{"taskType", "summarize"}, {"taskId", "t-1"}}, "nobody");
    ASSERT_TRUE(agentbus::tests::pump_until(reactor, [&]() {
        return agentbus::tests::is_ready(call.future);
    }));

    HttpReply reply = bridge.collect(call);
    EXPECT_EQ(reply.status, 408);
    EXPECT_EQ(reply.body["taskId"], "t-1");
}

TEST_F(LegacyBridgeTest, MalformedBodyIsRejectedBeforeSending)
{
    TaskCorrelator correlator(bus, reactor, metrics);
    LegacyBridge bridge(correlator, "legacy-api");

    EXPECT_THROW(bridge.submit({{"parameters", json::object()}}, "summarizer"), ValidationError);
    EXPECT_EQ(correlator.pending_count(), 0u);
}
