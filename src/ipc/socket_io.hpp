#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include "ipc/protocol.hpp"

namespace agentbus::ipc {

enum class IoStatus {
    OK,       // would block, try again on the next event
    CLOSED,   // orderly shutdown by the peer
    FAILED    // socket error
};

// Outbound frames of one connection, flushed across partial writes
struct Outbox {
    std::deque<std::vector<uint8_t>> frames;
    size_t offset = 0; // bytes of frames.front() already written

    bool empty() const { return frames.empty(); }
    size_t size() const { return frames.size(); }
    void clear() {
        frames.clear();
        offset = 0;
    }
};

bool set_nonblocking(int fd);

// True when the path fits in sockaddr_un::sun_path
bool fits_unix_path(const std::string& path);

// Read everything currently available into the decoder
IoStatus read_available(int fd, FrameDecoder& decoder, uint64_t& bytes_read);

// Write as much of the outbox as the socket accepts
IoStatus flush_outbox(int fd, Outbox& outbox, uint64_t& bytes_written);

} // namespace agentbus::ipc
