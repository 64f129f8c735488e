// tests/test_task_correlator.cpp
//
// Request/response correlation over the in-process bus.

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "ipc/errors.hpp"
#include "ipc/in_process_transport.hpp"
#include "ipc/task.hpp"
#include "kernel/reactor.hpp"
#include "kernel/task_correlator.hpp"
#include "kernel/trace_context.hpp"
#include "metrics/metrics.hpp"
#include "test_helpers.hpp"

using namespace agentbus::ipc;
using agentbus::kernel::Reactor;
using agentbus::kernel::TaskCorrelator;
using agentbus::metrics::MetricsCollector;
using agentbus::tests::is_ready;
using agentbus::tests::pump_until;
using json = nlohmann::json;

namespace {

TaskRequest make_request(const std::string& task_id, json parameters = json::object()) {
    TaskRequest request;
    request.task_id = task_id;
    request.task_type = "echo";
    request.parameters = std::move(parameters);
    return request;
}

} // namespace

class TaskCorrelatorTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(reactor.init()); }

    // "worker" answers every request with its parameters
    void start_echo_worker() {
        bus.subscribe("worker", [this](const Envelope& env) {
            TaskRequest request = TaskRequest::from_json(env.payload);
            bus.send(make_task_response_envelope(env, "worker",
                TaskResponse::completed(request.task_id, request.parameters)));
        });
    }

    Reactor reactor;
    MetricsCollector metrics;
    InProcessTransport bus{metrics};
};

TEST_F(TaskCorrelatorTest, ResponseSettlesTheFuture)
{
    start_echo_worker();
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1", {{"value", 42}}),
                                               "worker", "caller", 1000);
    ASSERT_TRUE(is_ready(future));

    TaskResponse response = future.get();
    EXPECT_EQ(response.task_id, "t-1");
    EXPECT_EQ(response.status, TaskStatus::COMPLETED);
    EXPECT_EQ(response.result["value"], 42);
    EXPECT_EQ(correlator.pending_count(), 0u);
    EXPECT_EQ(bus.subscriber_count("caller"), 0u);
    EXPECT_EQ(reactor.pending_timers(), 0u);
    EXPECT_EQ(metrics.value("task_completed", {{"status", "COMPLETED"}}), 1u);
}

TEST_F(TaskCorrelatorTest, SilenceEndsInTimeoutAndLateReplyIsIgnored)
{
    Envelope captured;
    bus.subscribe("worker", [&](const Envelope& env) { captured = env; });
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 30);
    EXPECT_FALSE(is_ready(future));
    ASSERT_TRUE(pump_until(reactor, [&]() { return is_ready(future); }));

    try {
        future.get();
        FAIL() << "expected TaskTimeoutError";
    } catch (const TaskTimeoutError& e) {
        EXPECT_EQ(e.task_id(), "t-1");
        EXPECT_EQ(e.timeout_ms(), 30);
        EXPECT_STREQ(e.what(), "Task request timeout after 30ms");
    }
    EXPECT_EQ(metrics.total("task_timeout"), 1u);
    EXPECT_EQ(correlator.pending_count(), 0u);

    EXPECT_NO_THROW(bus.send(make_task_response_envelope(captured, "worker",
        TaskResponse::completed("t-1", json::object()))));
    EXPECT_EQ(metrics.total("task_completed"), 0u);
}

TEST_F(TaskCorrelatorTest, RepliesForOtherTasksAreIgnored)
{
    Envelope captured;
    bus.subscribe("worker", [&](const Envelope& env) { captured = env; });
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000);

    Envelope stray = make_task_response_envelope(captured, "worker",
        TaskResponse::completed("t-2", json::object()));
    stray.correlation_id = "t-2";
    bus.send(stray);
    EXPECT_FALSE(is_ready(future));

    Envelope not_a_response = make_envelope(MessageType::TASK_REQUEST, "worker", "caller",
                                            json::object());
    not_a_response.correlation_id = "t-1";
    bus.send(not_a_response);
    EXPECT_FALSE(is_ready(future));

    bus.send(make_task_response_envelope(captured, "worker",
        TaskResponse::failed("t-1", "BOOM", "it broke")));
    ASSERT_TRUE(is_ready(future));
    TaskResponse response = future.get();
    EXPECT_EQ(response.status, TaskStatus::FAILED);
    EXPECT_EQ(response.error_code, "BOOM");
}

TEST_F(TaskCorrelatorTest, MalformedResponseFailsTheFuture)
{
    bus.subscribe("worker", [this](const Envelope& env) {
        Envelope reply = make_envelope(MessageType::TASK_RESPONSE, "worker", env.sender,
                                       {{"taskId", "t-1"}});
        reply.correlation_id = env.correlation_id;
        bus.send(reply);
    });
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000);
    ASSERT_TRUE(is_ready(future));
    EXPECT_THROW(future.get(), ValidationError);
}

TEST_F(TaskCorrelatorTest, NullOptionalFieldsReadAsAbsent)
{
    bus.subscribe("worker", [this](const Envelope& env) {
        Envelope reply = make_envelope(MessageType::TASK_RESPONSE, "worker", env.sender,
            {{"taskId", "t-1"}, {"status", "COMPLETED"}, {"result", {{"value", 42}}},
             {"errorCode", nullptr}, {"errorMessage", nullptr},
             {"metrics", {{"processingTimeMs", nullptr}, {"tokensUsed", 12}}}});
        reply.correlation_id = env.correlation_id;
        bus.send(reply);
    });
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000);
    ASSERT_TRUE(is_ready(future));

    TaskResponse response = future.get();
    EXPECT_EQ(response.status, TaskStatus::COMPLETED);
    EXPECT_EQ(response.result["value"], 42);
    EXPECT_TRUE(response.error_code.empty());
    EXPECT_TRUE(response.error_message.empty());
    EXPECT_EQ(response.metrics.processing_time_ms, 0);
    EXPECT_EQ(response.metrics.tokens_used, 12u);
}

TEST_F(TaskCorrelatorTest, RequestFromAnotherThreadIsAnswered)
{
    start_echo_worker();
    TaskCorrelator correlator(bus, reactor, metrics);
    reactor.poll(0);

    std::future<TaskResponse> future;
    std::thread caller([&]() {
        future = correlator.send_task_request(make_request("t-1", {{"value", 7}}),
                                              "worker", "caller", 1000);
    });
    caller.join();

    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(future.get().result["value"], 7);
    EXPECT_EQ(correlator.pending_count(), 0u);
    EXPECT_EQ(reactor.pending_timers(), 0u);
}

TEST_F(TaskCorrelatorTest, TimeoutForAnotherThreadFiresOnTheLoop)
{
    bus.subscribe("worker", [](const Envelope&) {});
    TaskCorrelator correlator(bus, reactor, metrics);
    reactor.poll(0);

    std::atomic<bool> sent{false};
    std::future<TaskResponse> future;
    std::thread caller([&]() {
        future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 30);
        sent = true;
    });

    // The loop is blocked in poll() while the caller registers its timer
    ASSERT_TRUE(pump_until(reactor, [&]() { return sent.load() && is_ready(future); }));
    caller.join();

    EXPECT_THROW(future.get(), TaskTimeoutError);
    EXPECT_EQ(metrics.total("task_timeout"), 1u);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST_F(TaskCorrelatorTest, DuplicatePendingIdIsRejected)
{
    bus.subscribe("worker", [](const Envelope&) {});
    TaskCorrelator correlator(bus, reactor, metrics);

    auto first = correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000);
    EXPECT_THROW(correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000),
                 std::invalid_argument);
    EXPECT_EQ(correlator.pending_count(), 1u);
    EXPECT_TRUE(correlator.abandon("t-1"));
}

TEST_F(TaskCorrelatorTest, AbandonCancelsOnce)
{
    bus.subscribe("worker", [](const Envelope&) {});
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000);
    EXPECT_TRUE(correlator.abandon("t-1"));
    EXPECT_FALSE(correlator.abandon("t-1"));
    EXPECT_THROW(future.get(), TaskCancelledError);
    EXPECT_EQ(reactor.pending_timers(), 0u);
    EXPECT_EQ(bus.subscriber_count("caller"), 0u);
}

TEST_F(TaskCorrelatorTest, DestructionCancelsPendingTasks)
{
    bus.subscribe("worker", [](const Envelope&) {});
    std::future<TaskResponse> future;
    {
        TaskCorrelator correlator(bus, reactor, metrics);
        future = correlator.send_task_request(make_request("t-1"), "worker", "caller", 1000);
    }
    ASSERT_TRUE(is_ready(future));
    EXPECT_THROW(future.get(), TaskCancelledError);
    EXPECT_EQ(reactor.pending_timers(), 0u);
}

TEST_F(TaskCorrelatorTest, SendFailureSurfacesThroughTheFuture)
{
    TaskCorrelator correlator(bus, reactor, metrics);

    auto future = correlator.send_task_request(make_request("t-1"), "worker", "", 1000);
    ASSERT_TRUE(is_ready(future));
    EXPECT_THROW(future.get(), ValidationError);
    EXPECT_EQ(correlator.pending_count(), 0u);
    EXPECT_EQ(reactor.pending_timers(), 0u);
}

TEST_F(TaskCorrelatorTest, IncompleteRequestIsRejected)
{
    TaskCorrelator correlator(bus, reactor, metrics);
    TaskRequest request = make_request("t-1");
    request.task_type.clear();

    auto future = correlator.send_task_request(request, "worker", "caller", 1000);
    ASSERT_TRUE(is_ready(future));
    try {
        future.get();
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.fields(), std::vector<std::string>{"taskType"});
    }
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST_F(TaskCorrelatorTest, RequestEnvelopeCarriesCorrelationAndTrace)
{
    Envelope captured;
    bus.subscribe("worker", [&](const Envelope& env) { captured = env; });
    TaskCorrelator correlator(bus, reactor, metrics);

    TaskRequest request = make_request("t-1");
    request.priority = 9;

    auto ctx = agentbus::kernel::TraceContext::root();
    std::future<TaskResponse> future;
    {
        agentbus::kernel::ScopedTraceContext scope(ctx);
        future = correlator.send_task_request(request, "worker", "caller", 500);
    }

    EXPECT_EQ(captured.message_type, MessageType::TASK_REQUEST);
    EXPECT_EQ(captured.sender, "caller");
    EXPECT_EQ(captured.recipient, "worker");
    EXPECT_EQ(captured.correlation_id, std::optional<std::string>("t-1"));
    EXPECT_EQ(captured.trace_id, ctx.trace_id);
    EXPECT_NE(captured.span_id, ctx.span_id);
    EXPECT_EQ(captured.context.request_id, "t-1");
    EXPECT_EQ(captured.context.timeout_ms, 500);
    EXPECT_EQ(captured.delivery.priority, 9);
    ASSERT_EQ(captured.context.baggage.count(agentbus::kernel::TRACEPARENT_KEY), 1u);
    EXPECT_NE(captured.context.baggage.at(agentbus::kernel::TRACEPARENT_KEY).find(ctx.trace_id),
              std::string::npos);
    EXPECT_EQ(captured.payload["taskId"], "t-1");
    EXPECT_EQ(captured.payload["taskType"], "echo");

    correlator.abandon("t-1");
}
