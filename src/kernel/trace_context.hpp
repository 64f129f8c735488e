/**
 * Trace context propagation
 *
 * The active trace context is thread-local. Transports capture it when a message
 * is sent and re-activate it (ScopedTraceContext) around every handler call so
 * work triggered by a message is attributed to the sender's trace.
 *
 * On the wire the context travels in the envelope's baggage map under the W3C
 * `traceparent` key: "00-<32 hex trace id>-<16 hex span id>-01".
 */
#pragma once
#include <map>
#include <string>
#include "ipc/envelope.hpp"

namespace agentbus::kernel {

struct TraceContext {
    std::string trace_id;
    std::string span_id;
    std::map<std::string, std::string> baggage;

    bool empty() const { return trace_id.empty(); }

    // Currently active context on this thread (empty when none)
    static const TraceContext& current();

    // New root context with fresh ids
    static TraceContext root();

    // Child span of this context (fresh root when empty)
    TraceContext child() const;
};

// Activates a context for the lifetime of the object, restoring the previous one
class ScopedTraceContext {
public:
    explicit ScopedTraceContext(TraceContext context);
    ~ScopedTraceContext();

    ScopedTraceContext(const ScopedTraceContext&) = delete;
    ScopedTraceContext& operator=(const ScopedTraceContext&) = delete;

private:
    TraceContext previous_;
};

constexpr const char* TRACEPARENT_KEY = "traceparent";

// Write context ids and baggage into an envelope's propagation context
void inject(const TraceContext& context, ipc::PropagationContext& carrier);

// Read the context an envelope carries: traceparent first, then the explicit ids
TraceContext extract(const ipc::Envelope& envelope);

} // namespace agentbus::kernel
