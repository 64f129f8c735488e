#include "kernel/trace_context.hpp"
#include "util/uid.hpp"
#include <utility>

namespace agentbus::kernel {

namespace {

thread_local TraceContext t_current;

bool is_hex(const std::string& s) {
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return !s.empty();
}

// "00-<trace>-<span>-<flags>"
bool parse_traceparent(const std::string& value, std::string& trace_id, std::string& span_id) {
    if (value.size() != 55 || value[2] != '-' || value[35] != '-' || value[52] != '-') {
        return false;
    }
    std::string trace = value.substr(3, 32);
    std::string span = value.substr(36, 16);
    if (!is_hex(trace) || !is_hex(span)) {
        return false;
    }
    trace_id = std::move(trace);
    span_id = std::move(span);
    return true;
}

} // namespace

const TraceContext& TraceContext::current() {
    return t_current;
}

TraceContext TraceContext::root() {
    TraceContext ctx;
    ctx.trace_id = util::generate_trace_id();
    ctx.span_id = util::generate_span_id();
    return ctx;
}

TraceContext TraceContext::child() const {
    if (empty()) {
        return root();
    }
    TraceContext ctx = *this;
    ctx.span_id = util::generate_span_id();
    return ctx;
}

ScopedTraceContext::ScopedTraceContext(TraceContext context)
    : previous_(std::exchange(t_current, std::move(context))) {}

ScopedTraceContext::~ScopedTraceContext() {
    t_current = std::move(previous_);
}

void inject(const TraceContext& context, ipc::PropagationContext& carrier) {
    for (const auto& [key, value] : context.baggage) {
        carrier.baggage[key] = value;
    }
    if (context.empty()) {
        return;
    }
    carrier.trace_id = context.trace_id;
    carrier.span_id = context.span_id;
    carrier.baggage[TRACEPARENT_KEY] = "00-" + context.trace_id + "-" + context.span_id + "-01";
}

TraceContext extract(const ipc::Envelope& envelope) {
    TraceContext ctx;
    ctx.baggage = envelope.context.baggage;

    auto it = ctx.baggage.find(TRACEPARENT_KEY);
    if (it != ctx.baggage.end() && parse_traceparent(it->second, ctx.trace_id, ctx.span_id)) {
        return ctx;
    }

    ctx.trace_id = !envelope.context.trace_id.empty() ? envelope.context.trace_id : envelope.trace_id;
    ctx.span_id = !envelope.context.span_id.empty() ? envelope.context.span_id : envelope.span_id;
    return ctx;
}

} // namespace agentbus::kernel
