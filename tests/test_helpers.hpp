// tests/test_helpers.hpp
//
// Shared helpers: drive a reactor until a condition holds, temporary socket
// paths, and a blocking client that speaks the wire protocol byte for byte.
#pragma once

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ipc/protocol.hpp"
#include "kernel/reactor.hpp"

namespace agentbus::tests {

using json = nlohmann::json;

// Poll the reactor until `done` returns true; false on timeout
inline bool pump_until(kernel::Reactor& reactor, const std::function<bool()>& done,
                       int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        reactor.poll(5);
    }
    return true;
}

// Poll for a fixed time regardless of activity
inline void pump_for(kernel::Reactor& reactor, int duration_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        reactor.poll(5);
    }
}

template <typename T>
bool is_ready(const std::future<T>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

inline std::string temp_socket_path(const std::string& tag) {
    static std::atomic<int> counter{0};
    return "/tmp/agentbus_test_" + tag + "_" + std::to_string(getpid()) + "_" +
           std::to_string(counter++) + ".sock";
}

// Blocking Unix-socket client used to poke the server at the wire level. Reads
// never block: the caller's reactor is pumped between attempts so a server on
// the same thread keeps running.
class RawClient {
public:
    explicit RawClient(const std::string& path) {
        fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (fd_ >= 0 && ::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // Wrap an fd accepted by a test-owned listener
    static RawClient adopt(int fd) {
        RawClient client;
        client.fd_ = fd;
        return client;
    }

    RawClient(RawClient&& other) noexcept
        : fd_(other.fd_), closed_(other.closed_), decoder_(std::move(other.decoder_)) {
        other.fd_ = -1;
    }

    ~RawClient() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    RawClient(const RawClient&) = delete;
    RawClient& operator=(const RawClient&) = delete;

    bool connected() const { return fd_ >= 0; }
    bool closed() const { return closed_; }

    void send_record(const json& record) {
        send_bytes(ipc::encode_frame(record));
    }

    void send_bytes(const std::vector<uint8_t>& bytes) {
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return;
            }
            sent += static_cast<size_t>(n);
        }
    }

    // Next record from the server, or nullopt on timeout / close
    std::optional<json> read_record(kernel::Reactor& reactor, int timeout_ms = 2000) {
        std::optional<json> record;
        pump_until(reactor, [&]() {
            if (auto body = decoder_.next()) {
                record = ipc::decode_record(*body);
                return true;
            }
            return !receive();
        }, timeout_ms);
        return record;
    }

    // Skip records until one matches; nullopt on timeout / close
    std::optional<json> read_until(kernel::Reactor& reactor,
                                   const std::function<bool(const json&)>& match,
                                   int timeout_ms = 2000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            auto record = read_record(reactor, timeout_ms);
            if (!record) {
                return std::nullopt;
            }
            if (match(*record)) {
                return record;
            }
        }
        return std::nullopt;
    }

    // Wait for the server to close the connection
    bool wait_closed(kernel::Reactor& reactor, int timeout_ms = 2000) {
        return pump_until(reactor, [&]() {
            while (decoder_.next()) {
            }
            return !receive();
        }, timeout_ms);
    }

private:
    RawClient() = default;

    int fd_ = -1;
    bool closed_ = false;
    ipc::FrameDecoder decoder_;

    // Pull whatever is available; false once the peer has closed
    bool receive() {
        if (fd_ < 0 || closed_) {
            return false;
        }
        uint8_t buf[4096];
        ssize_t n = recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0) {
            decoder_.feed(buf, static_cast<size_t>(n));
        } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
            closed_ = true;
            return false;
        }
        return true;
    }
};

inline json envelope_record(const std::string& id, const std::string& sender,
                            const std::string& recipient, const json& payload = json::object()) {
    return {
        {"id", id},
        {"sender", sender},
        {"recipient", recipient},
        {"messageType", "TASK_REQUEST"},
        {"payload", payload}
    };
}

} // namespace agentbus::tests
