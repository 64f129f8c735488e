#include "ipc/socket_io.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace agentbus::ipc {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::error("Failed to set O_NONBLOCK on fd {}: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool fits_unix_path(const std::string& path) {
    return !path.empty() && path.size() < sizeof(sockaddr_un::sun_path);
}

IoStatus read_available(int fd, FrameDecoder& decoder, uint64_t& bytes_read) {
    uint8_t buf[65536];
    while (true) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            decoder.feed(buf, static_cast<size_t>(n));
            bytes_read += static_cast<uint64_t>(n);
            continue;
        }
        if (n == 0) {
            return IoStatus::CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::OK;
        }
        spdlog::debug("recv on fd {} failed: {}", fd, strerror(errno));
        return IoStatus::FAILED;
    }
}

IoStatus flush_outbox(int fd, Outbox& outbox, uint64_t& bytes_written) {
    while (!outbox.frames.empty()) {
        const auto& frame = outbox.frames.front();
        ssize_t n = ::send(fd, frame.data() + outbox.offset, frame.size() - outbox.offset,
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return IoStatus::OK;
            }
            spdlog::debug("send on fd {} failed: {}", fd, strerror(errno));
            return errno == EPIPE || errno == ECONNRESET ? IoStatus::CLOSED : IoStatus::FAILED;
        }

        bytes_written += static_cast<uint64_t>(n);
        outbox.offset += static_cast<size_t>(n);
        if (outbox.offset == frame.size()) {
            outbox.frames.pop_front();
            outbox.offset = 0;
        }
    }
    return IoStatus::OK;
}

} // namespace agentbus::ipc
