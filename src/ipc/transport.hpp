#pragma once
#include <functional>
#include <string>
#include "ipc/envelope.hpp"

namespace agentbus::ipc {

using EnvelopeHandler = std::function<void(const Envelope&)>;

// Removes exactly the registration it was returned for; safe to call twice
using Unsubscribe = std::function<void()>;

// What the correlation layer needs from any transport
class Transport {
public:
    virtual ~Transport() = default;

    // Deliver or hand off an envelope. Throws ValidationError for a malformed
    // envelope and QueueFullError under backpressure.
    virtual void send(const Envelope& envelope) = 0;

    // Receive envelopes addressed to `recipient`
    virtual Unsubscribe subscribe(const std::string& recipient, EnvelopeHandler handler) = 0;

    virtual const char* name() const = 0;
};

} // namespace agentbus::ipc
