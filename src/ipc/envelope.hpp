/**
 * Message envelope
 *
 * The transport-agnostic wrapper every transport carries. Wire field names are
 * camelCase so records stay readable by the non-C++ peers of the platform.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbus::ipc {

enum class MessageType {
    TASK_REQUEST,
    TASK_RESPONSE,
    HELLO,
    ACK,
    PING,
    PONG
};

enum class DeliveryGuarantee {
    AT_MOST_ONCE,
    AT_LEAST_ONCE,
    EXACTLY_ONCE
};

const char* message_type_to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& name);

const char* guarantee_to_string(DeliveryGuarantee guarantee);
std::optional<DeliveryGuarantee> guarantee_from_string(const std::string& name);

// HELLO/ACK/PING/PONG never reach business handlers
bool is_control_type(MessageType type);

// Declared reliability policy; informs senders, not enforced by the transports
struct DeliveryPolicy {
    DeliveryGuarantee guarantee = DeliveryGuarantee::AT_LEAST_ONCE;
    int retry_count = 3;
    int retry_delay_ms = 1000;
    bool require_ack = true;
    int priority = 5;
};

// Tracing state carried across a process boundary
struct PropagationContext {
    std::string trace_id;
    std::string span_id;
    std::map<std::string, std::string> baggage;
    std::string request_id;
    int64_t timeout_ms = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

struct Envelope {
    std::string id;
    std::optional<std::string> correlation_id;
    std::string trace_id;
    std::string span_id;
    std::string sender;
    std::string recipient;
    MessageType message_type = MessageType::TASK_REQUEST;
    nlohmann::json payload;
    DeliveryPolicy delivery;
    PropagationContext context;
    int64_t created_at_ms = 0;
    std::vector<std::string> tags;
    std::vector<std::string> permissions;

    // Fields this version does not interpret, re-emitted verbatim
    nlohmann::json extensions = nlohmann::json::object();
};

// Parse and validate a raw record. Throws ValidationError listing every
// offending field. Pure: the same input always yields the same envelope.
Envelope validate(const nlohmann::json& raw);

// Re-check an envelope built in code before a transport accepts it
void check(const Envelope& envelope);

nlohmann::json to_json(const Envelope& envelope);

// Fresh id, trace/span ids and creation time
Envelope make_envelope(MessageType type, const std::string& sender,
                       const std::string& recipient, nlohmann::json payload);

} // namespace agentbus::ipc
