#include "ipc/envelope.hpp"
#include "ipc/errors.hpp"
#include "util/uid.hpp"
#include <array>

using json = nlohmann::json;

namespace agentbus::ipc {

namespace {

constexpr std::array<const char*, 13> kKnownFields = {
    "id", "correlationId", "traceId", "spanId", "sender", "recipient", "messageType",
    "payload", "delivery", "context", "createdAt", "tags", "permissions"
};

bool is_known_field(const std::string& key) {
    for (const char* field : kKnownFields) {
        if (key == field) {
            return true;
        }
    }
    return false;
}

bool is_nonempty_string(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

bool is_string_array(const json& j) {
    if (!j.is_array()) {
        return false;
    }
    for (const auto& item : j) {
        if (!item.is_string()) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> to_string_vector(const json& j) {
    std::vector<std::string> out;
    for (const auto& item : j) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

// Optional string member: absent and null are both "not set"
bool optional_string_ok(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() || it->is_null() || it->is_string();
}

std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

void parse_delivery(const json& raw, DeliveryPolicy& delivery, std::vector<std::string>& errors) {
    if (!raw.is_object()) {
        errors.push_back("delivery");
        return;
    }
    if (auto it = raw.find("guarantee"); it != raw.end()) {
        auto guarantee = it->is_string() ? guarantee_from_string(it->get<std::string>()) : std::nullopt;
        if (guarantee) {
            delivery.guarantee = *guarantee;
        } else {
            errors.push_back("delivery.guarantee");
        }
    }
    auto read_int = [&](const char* key, int& target) {
        auto it = raw.find(key);
        if (it == raw.end()) {
            return;
        }
        if (it->is_number_integer()) {
            target = it->get<int>();
        } else {
            errors.push_back(std::string("delivery.") + key);
        }
    };
    read_int("retryCount", delivery.retry_count);
    read_int("retryDelayMs", delivery.retry_delay_ms);
    read_int("priority", delivery.priority);
    if (auto it = raw.find("requireAck"); it != raw.end()) {
        if (it->is_boolean()) {
            delivery.require_ack = it->get<bool>();
        } else {
            errors.push_back("delivery.requireAck");
        }
    }
}

void parse_context(const json& raw, PropagationContext& ctx, std::vector<std::string>& errors) {
    if (!raw.is_object()) {
        errors.push_back("context");
        return;
    }
    for (const char* key : {"traceId", "spanId", "requestId"}) {
        if (!optional_string_ok(raw, key)) {
            errors.push_back(std::string("context.") + key);
        }
    }
    ctx.trace_id = optional_string(raw, "traceId");
    ctx.span_id = optional_string(raw, "spanId");
    ctx.request_id = optional_string(raw, "requestId");

    if (auto it = raw.find("baggage"); it != raw.end() && !it->is_null()) {
        if (!it->is_object()) {
            errors.push_back("context.baggage");
        } else {
            for (auto& [key, value] : it->items()) {
                if (value.is_string()) {
                    ctx.baggage[key] = value.get<std::string>();
                } else {
                    errors.push_back("context.baggage." + key);
                }
            }
        }
    }
    if (auto it = raw.find("timeoutMs"); it != raw.end()) {
        if (it->is_number_integer()) {
            ctx.timeout_ms = it->get<int64_t>();
        } else {
            errors.push_back("context.timeoutMs");
        }
    }
    if (auto it = raw.find("metadata"); it != raw.end() && !it->is_null()) {
        ctx.metadata = *it;
    }
}

} // namespace

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::TASK_REQUEST:  return "TASK_REQUEST";
        case MessageType::TASK_RESPONSE: return "TASK_RESPONSE";
        case MessageType::HELLO:         return "HELLO";
        case MessageType::ACK:           return "ACK";
        case MessageType::PING:          return "PING";
        case MessageType::PONG:          return "PONG";
    }
    return "UNKNOWN";
}

std::optional<MessageType> message_type_from_string(const std::string& name) {
    if (name == "TASK_REQUEST")  return MessageType::TASK_REQUEST;
    if (name == "TASK_RESPONSE") return MessageType::TASK_RESPONSE;
    if (name == "HELLO")         return MessageType::HELLO;
    if (name == "ACK")           return MessageType::ACK;
    if (name == "PING")          return MessageType::PING;
    if (name == "PONG")          return MessageType::PONG;
    return std::nullopt;
}

const char* guarantee_to_string(DeliveryGuarantee guarantee) {
    switch (guarantee) {
        case DeliveryGuarantee::AT_MOST_ONCE:  return "AT_MOST_ONCE";
        case DeliveryGuarantee::AT_LEAST_ONCE: return "AT_LEAST_ONCE";
        case DeliveryGuarantee::EXACTLY_ONCE:  return "EXACTLY_ONCE";
    }
    return "UNKNOWN";
}

std::optional<DeliveryGuarantee> guarantee_from_string(const std::string& name) {
    if (name == "AT_MOST_ONCE")  return DeliveryGuarantee::AT_MOST_ONCE;
    if (name == "AT_LEAST_ONCE") return DeliveryGuarantee::AT_LEAST_ONCE;
    if (name == "EXACTLY_ONCE")  return DeliveryGuarantee::EXACTLY_ONCE;
    return std::nullopt;
}

bool is_control_type(MessageType type) {
    return type == MessageType::HELLO || type == MessageType::ACK ||
           type == MessageType::PING || type == MessageType::PONG;
}

Envelope validate(const json& raw) {
    if (!raw.is_object()) {
        throw ValidationError({"envelope"});
    }

    std::vector<std::string> errors;
    for (const char* key : {"id", "sender", "recipient"}) {
        if (!is_nonempty_string(raw, key)) {
            errors.push_back(key);
        }
    }

    Envelope env;
    if (!is_nonempty_string(raw, "messageType")) {
        errors.push_back("messageType");
    } else if (auto type = message_type_from_string(raw["messageType"].get<std::string>())) {
        env.message_type = *type;
    } else {
        errors.push_back("messageType");
    }

    for (const char* key : {"correlationId", "traceId", "spanId"}) {
        if (!optional_string_ok(raw, key)) {
            errors.push_back(key);
        }
    }

    if (auto it = raw.find("delivery"); it != raw.end() && !it->is_null()) {
        parse_delivery(*it, env.delivery, errors);
    }
    if (auto it = raw.find("context"); it != raw.end() && !it->is_null()) {
        parse_context(*it, env.context, errors);
    }
    if (auto it = raw.find("createdAt"); it != raw.end() && !it->is_null()) {
        if (it->is_number_integer()) {
            env.created_at_ms = it->get<int64_t>();
        } else {
            errors.push_back("createdAt");
        }
    }
    for (const char* key : {"tags", "permissions"}) {
        auto it = raw.find(key);
        if (it != raw.end() && !it->is_null() && !is_string_array(*it)) {
            errors.push_back(key);
        }
    }

    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }

    env.id = raw["id"].get<std::string>();
    env.sender = raw["sender"].get<std::string>();
    env.recipient = raw["recipient"].get<std::string>();
    if (auto it = raw.find("correlationId"); it != raw.end() && it->is_string()) {
        env.correlation_id = it->get<std::string>();
    }
    env.trace_id = optional_string(raw, "traceId");
    env.span_id = optional_string(raw, "spanId");
    if (auto it = raw.find("payload"); it != raw.end()) {
        env.payload = *it;
    }
    if (auto it = raw.find("tags"); it != raw.end() && it->is_array()) {
        env.tags = to_string_vector(*it);
    }
    if (auto it = raw.find("permissions"); it != raw.end() && it->is_array()) {
        env.permissions = to_string_vector(*it);
    }

    for (auto& [key, value] : raw.items()) {
        if (!is_known_field(key)) {
            env.extensions[key] = value;
        }
    }
    return env;
}

void check(const Envelope& envelope) {
    std::vector<std::string> errors;
    if (envelope.id.empty()) errors.push_back("id");
    if (envelope.sender.empty()) errors.push_back("sender");
    if (envelope.recipient.empty()) errors.push_back("recipient");
    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }
}

json to_json(const Envelope& envelope) {
    json j = envelope.extensions.is_object() ? envelope.extensions : json::object();

    j["id"] = envelope.id;
    if (envelope.correlation_id) {
        j["correlationId"] = *envelope.correlation_id;
    }
    j["traceId"] = envelope.trace_id;
    j["spanId"] = envelope.span_id;
    j["sender"] = envelope.sender;
    j["recipient"] = envelope.recipient;
    j["messageType"] = message_type_to_string(envelope.message_type);
    j["payload"] = envelope.payload;

    j["delivery"] = {
        {"guarantee", guarantee_to_string(envelope.delivery.guarantee)},
        {"retryCount", envelope.delivery.retry_count},
        {"retryDelayMs", envelope.delivery.retry_delay_ms},
        {"requireAck", envelope.delivery.require_ack},
        {"priority", envelope.delivery.priority}
    };

    json baggage = json::object();
    for (const auto& [key, value] : envelope.context.baggage) {
        baggage[key] = value;
    }
    j["context"] = {
        {"traceId", envelope.context.trace_id},
        {"spanId", envelope.context.span_id},
        {"baggage", baggage},
        {"requestId", envelope.context.request_id},
        {"timeoutMs", envelope.context.timeout_ms},
        {"metadata", envelope.context.metadata}
    };

    j["createdAt"] = envelope.created_at_ms;
    j["tags"] = envelope.tags;
    j["permissions"] = envelope.permissions;
    return j;
}

Envelope make_envelope(MessageType type, const std::string& sender,
                       const std::string& recipient, json payload) {
    Envelope env;
    env.id = util::generate_uuid();
    env.trace_id = util::generate_trace_id();
    env.span_id = util::generate_span_id();
    env.sender = sender;
    env.recipient = recipient;
    env.message_type = type;
    env.payload = std::move(payload);
    env.context.trace_id = env.trace_id;
    env.context.span_id = env.span_id;
    env.created_at_ms = util::now_ms();
    return env;
}

} // namespace agentbus::ipc
