/**
 * agentbus wire protocol
 *
 * Every record on a Unix-socket connection is framed as
 *   [u32 big-endian length][MessagePack map of `length` bytes]
 *
 * Control records (never delivered to business handlers):
 *   {type:"HELLO", ts, client}     client -> server, first record on a connection
 *   {type:"ACK",   ts, version}    server -> client, answers HELLO
 *   {type:"PING",  ts}             server -> client, every heartbeat interval
 *   {type:"PONG",  ts}             client -> server, answers PING and on its own timer
 *   {error:"handshake_timeout"}    server -> client, before closing
 *   {error:"invalid_message", details}
 *
 * Application records are full envelopes (see ipc/envelope.hpp).
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbus::ipc {

constexpr int PROTOCOL_VERSION = 1;
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr size_t DEFAULT_MAX_FRAME_SIZE = 10 * 1024 * 1024; // 10MB

enum class ControlType {
    HELLO,
    ACK,
    PING,
    PONG,
    ERROR
};

enum class RecordKind {
    CONTROL,
    APPLICATION
};

struct ControlRecord {
    ControlType type;
    int64_t ts = 0;
    std::string client;     // HELLO
    int version = 0;        // ACK
    std::string error;      // ERROR
    nlohmann::json details; // ERROR
};

// Length-prefix a record. Throws FrameError when the encoding exceeds max_frame_size.
std::vector<uint8_t> encode_frame(const nlohmann::json& record,
                                  size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

// Decode one frame body. Throws FrameError on bytes that are not a MessagePack map.
nlohmann::json decode_record(const std::vector<uint8_t>& body);

// Control records carry `type` or `error` and no `messageType`; envelopes whose
// messageType is HELLO/ACK/PING/PONG count as control traffic too.
RecordKind classify_record(const nlohmann::json& record);

// Interpret a control record; nullopt when the record is not one
std::optional<ControlRecord> parse_control(const nlohmann::json& record);

nlohmann::json make_hello(const std::string& client);
nlohmann::json make_ack();
nlohmann::json make_ping();
nlohmann::json make_pong();
nlohmann::json make_handshake_timeout();
nlohmann::json make_invalid_message(const nlohmann::json& details);

const char* control_type_to_string(ControlType type);

// Reassembles frames from arbitrary read boundaries
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE)
        : max_frame_size_(max_frame_size) {}

    void feed(const uint8_t* data, size_t len);

    // Next complete frame body, or nullopt if more bytes are needed.
    // Throws FrameError when the declared length exceeds the limit.
    std::optional<std::vector<uint8_t>> next();

    size_t buffered() const { return buffer_.size() - offset_; }
    void reset();

private:
    size_t max_frame_size_;
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;

    void compact();
};

} // namespace agentbus::ipc
