#include "ipc/protocol.hpp"
#include "ipc/envelope.hpp"
#include "ipc/errors.hpp"
#include "util/uid.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace agentbus::ipc {

std::vector<uint8_t> encode_frame(const json& record, size_t max_frame_size) {
    std::vector<uint8_t> body = json::to_msgpack(record);
    if (body.size() > max_frame_size) {
        throw FrameError("frame too large: " + std::to_string(body.size()) + " bytes");
    }

    auto len = static_cast<uint32_t>(body.size());
    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + body.size());
    frame[0] = static_cast<uint8_t>(len >> 24);
    frame[1] = static_cast<uint8_t>(len >> 16);
    frame[2] = static_cast<uint8_t>(len >> 8);
    frame[3] = static_cast<uint8_t>(len);
    std::copy(body.begin(), body.end(), frame.begin() + FRAME_HEADER_SIZE);
    return frame;
}

json decode_record(const std::vector<uint8_t>& body) {
    json record;
    try {
        record = json::from_msgpack(body);
    } catch (const json::exception& e) {
        throw FrameError(std::string("undecodable frame: ") + e.what());
    }
    if (!record.is_object()) {
        throw FrameError("frame is not a map");
    }
    return record;
}

RecordKind classify_record(const json& record) {
    auto mt = record.find("messageType");
    if (mt != record.end()) {
        if (mt->is_string()) {
            auto type = message_type_from_string(mt->get<std::string>());
            if (type && is_control_type(*type)) {
                return RecordKind::CONTROL;
            }
        }
        return RecordKind::APPLICATION;
    }
    if (record.contains("type") || record.contains("error")) {
        return RecordKind::CONTROL;
    }
    return RecordKind::APPLICATION;
}

std::optional<ControlRecord> parse_control(const json& record) {
    if (!record.is_object()) {
        return std::nullopt;
    }

    ControlRecord control;
    if (auto it = record.find("error"); it != record.end() && it->is_string()) {
        control.type = ControlType::ERROR;
        control.error = it->get<std::string>();
        if (auto details = record.find("details"); details != record.end()) {
            control.details = *details;
        }
        return control;
    }

    // Envelope-shaped control traffic uses messageType instead of type
    std::string type;
    if (auto it = record.find("type"); it != record.end() && it->is_string()) {
        type = it->get<std::string>();
    } else if (auto mt = record.find("messageType"); mt != record.end() && mt->is_string()) {
        type = mt->get<std::string>();
    } else {
        return std::nullopt;
    }

    if (type == "HELLO") {
        control.type = ControlType::HELLO;
    } else if (type == "ACK") {
        control.type = ControlType::ACK;
    } else if (type == "PING") {
        control.type = ControlType::PING;
    } else if (type == "PONG") {
        control.type = ControlType::PONG;
    } else {
        return std::nullopt;
    }

    if (auto it = record.find("ts"); it != record.end() && it->is_number_integer()) {
        control.ts = it->get<int64_t>();
    }
    if (auto it = record.find("client"); it != record.end() && it->is_string()) {
        control.client = it->get<std::string>();
    } else if (auto sender = record.find("sender"); sender != record.end() && sender->is_string()) {
        control.client = sender->get<std::string>();
    }
    if (auto it = record.find("version"); it != record.end() && it->is_number_integer()) {
        control.version = it->get<int>();
    }
    return control;
}

json make_hello(const std::string& client) {
    return {{"type", "HELLO"}, {"ts", util::now_ms()}, {"client", client}};
}

json make_ack() {
    return {{"type", "ACK"}, {"ts", util::now_ms()}, {"version", PROTOCOL_VERSION}};
}

json make_ping() {
    return {{"type", "PING"}, {"ts", util::now_ms()}};
}

json make_pong() {
    return {{"type", "PONG"}, {"ts", util::now_ms()}};
}

json make_handshake_timeout() {
    return {{"error", "handshake_timeout"}};
}

json make_invalid_message(const json& details) {
    return {{"error", "invalid_message"}, {"details", details}};
}

const char* control_type_to_string(ControlType type) {
    switch (type) {
        case ControlType::HELLO: return "HELLO";
        case ControlType::ACK:   return "ACK";
        case ControlType::PING:  return "PING";
        case ControlType::PONG:  return "PONG";
        case ControlType::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<std::vector<uint8_t>> FrameDecoder::next() {
    if (buffered() < FRAME_HEADER_SIZE) {
        compact();
        return std::nullopt;
    }

    const uint8_t* p = buffer_.data() + offset_;
    uint32_t len = (static_cast<uint32_t>(p[0]) << 24) |
                   (static_cast<uint32_t>(p[1]) << 16) |
                   (static_cast<uint32_t>(p[2]) << 8) |
                   static_cast<uint32_t>(p[3]);

    if (len > max_frame_size_) {
        throw FrameError("frame too large: " + std::to_string(len) +
                         " bytes (max " + std::to_string(max_frame_size_) + ")");
    }

    if (buffered() < FRAME_HEADER_SIZE + len) {
        compact();
        return std::nullopt;
    }

    std::vector<uint8_t> body(p + FRAME_HEADER_SIZE, p + FRAME_HEADER_SIZE + len);
    offset_ += FRAME_HEADER_SIZE + len;
    return body;
}

void FrameDecoder::reset() {
    buffer_.clear();
    offset_ = 0;
}

void FrameDecoder::compact() {
    if (offset_ == 0) {
        return;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
}

} // namespace agentbus::ipc
