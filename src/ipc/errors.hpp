#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agentbus::ipc {

// Base of every error raised by the transport core
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed envelope or task record; rejected before any delivery attempt
class ValidationError : public TransportError {
public:
    explicit ValidationError(std::vector<std::string> fields)
        : TransportError(build_message(fields)), fields_(std::move(fields)) {}

    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;

    static std::string build_message(const std::vector<std::string>& fields) {
        std::string msg = "invalid envelope: missing or invalid field(s):";
        for (size_t i = 0; i < fields.size(); ++i) {
            msg += (i == 0 ? " " : ", ") + fields[i];
        }
        return msg;
    }
};

// Oversized or undecodable wire frame
class FrameError : public TransportError {
public:
    explicit FrameError(const std::string& what) : TransportError(what) {}
};

// Backpressure: the bounded queue for a recipient or connection is full
class QueueFullError : public TransportError {
public:
    QueueFullError(const std::string& target, size_t limit)
        : TransportError("queue full for '" + target + "' (limit " + std::to_string(limit) + ")"),
          target_(target), limit_(limit) {}

    const std::string& target() const { return target_; }
    size_t limit() const { return limit_; }

private:
    std::string target_;
    size_t limit_;
};

// Server reported that our HELLO did not arrive in time
class HandshakeTimeoutError : public TransportError {
public:
    explicit HandshakeTimeoutError(const std::string& what) : TransportError(what) {}
};

// Client gave up waiting for ACK
class NoAckError : public TransportError {
public:
    explicit NoAckError(const std::string& what) : TransportError(what) {}
};

// A subscriber threw; recorded and counted, never propagated to the publisher
class DeliveryError : public TransportError {
public:
    DeliveryError(const std::string& recipient, const std::string& what)
        : TransportError("delivery to '" + recipient + "' failed: " + what) {}
};

class TaskTimeoutError : public TransportError {
public:
    TaskTimeoutError(const std::string& task_id, int timeout_ms)
        : TransportError("Task request timeout after " + std::to_string(timeout_ms) + "ms"),
          task_id_(task_id), timeout_ms_(timeout_ms) {}

    const std::string& task_id() const { return task_id_; }
    int timeout_ms() const { return timeout_ms_; }

private:
    std::string task_id_;
    int timeout_ms_;
};

class TaskCancelledError : public TransportError {
public:
    explicit TaskCancelledError(const std::string& task_id)
        : TransportError("Task request cancelled: " + task_id), task_id_(task_id) {}

    const std::string& task_id() const { return task_id_; }

private:
    std::string task_id_;
};

} // namespace agentbus::ipc
