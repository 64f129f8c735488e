// tests/test_trace_context.cpp

#include <gtest/gtest.h>

#include "ipc/envelope.hpp"
#include "kernel/trace_context.hpp"

using namespace agentbus::kernel;
using agentbus::ipc::Envelope;
using agentbus::ipc::MessageType;

TEST(TraceContextTest, ScopeRestoresPreviousContext)
{
    EXPECT_TRUE(TraceContext::current().empty());

    TraceContext outer = TraceContext::root();
    {
        ScopedTraceContext outer_scope(outer);
        EXPECT_EQ(TraceContext::current().trace_id, outer.trace_id);

        TraceContext inner = outer.child();
        {
            ScopedTraceContext inner_scope(inner);
            EXPECT_EQ(TraceContext::current().span_id, inner.span_id);
        }
        EXPECT_EQ(TraceContext::current().span_id, outer.span_id);
    }
    EXPECT_TRUE(TraceContext::current().empty());
}

TEST(TraceContextTest, ChildKeepsTraceWithNewSpan)
{
    TraceContext root = TraceContext::root();
    root.baggage["tenant"] = "acme";

    TraceContext child = root.child();
    EXPECT_EQ(child.trace_id, root.trace_id);
    EXPECT_NE(child.span_id, root.span_id);
    EXPECT_EQ(child.baggage.at("tenant"), "acme");

    EXPECT_FALSE(TraceContext{}.child().empty());
}

TEST(TraceContextTest, InjectThenExtractThroughTraceparent)
{
    TraceContext ctx = TraceContext::root();
    ctx.baggage["tenant"] = "acme";

    Envelope env = agentbus::ipc::make_envelope(MessageType::TASK_REQUEST, "a", "b", {});
    inject(ctx, env.context);

    const std::string& traceparent = env.context.baggage.at(TRACEPARENT_KEY);
    EXPECT_EQ(traceparent, "00-" + ctx.trace_id + "-" + ctx.span_id + "-01");

    // traceparent wins over the explicit ids
    env.context.trace_id = "ignored";
    TraceContext extracted = extract(env);
    EXPECT_EQ(extracted.trace_id, ctx.trace_id);
    EXPECT_EQ(extracted.span_id, ctx.span_id);
    EXPECT_EQ(extracted.baggage.at("tenant"), "acme");
}

TEST(TraceContextTest, ExtractFallsBackToExplicitIds)
{
    Envelope env = agentbus::ipc::make_envelope(MessageType::TASK_REQUEST, "a", "b", {});
    env.context.baggage[TRACEPARENT_KEY] = "garbage";

    TraceContext extracted = extract(env);
    EXPECT_EQ(extracted.trace_id, env.context.trace_id);
    EXPECT_EQ(extracted.span_id, env.context.span_id);

    env.context.trace_id.clear();
    EXPECT_EQ(extract(env).trace_id, env.trace_id);
}
