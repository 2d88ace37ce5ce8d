#include "platform/linux/tcp_socket_client.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

} // namespace

TcpSocketClient::TcpSocketClient() = default;

TcpSocketClient::~TcpSocketClient() {
    close();
}

IoError TcpSocketClient::fail(int err) {
    last_error_ = std::strerror(err);
    return IoError::Failed;
}

std::expected<void, IoError> TcpSocketClient::wait_for(short events, int timeout_ms) {
    if (timeout_ms <= 0) return std::unexpected(IoError::Timeout);
    pollfd pfd{.fd = fd_, .events = events, .revents = 0};
    while (true) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return std::unexpected(fail(errno));
        if (ret == 0) return std::unexpected(IoError::Timeout);
        return {};
    }
}

std::expected<void, IoError> TcpSocketClient::connect(const std::string& host, uint16_t port,
                                                      int timeout_ms) {
    close();
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return std::unexpected(fail(errno));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return std::unexpected(fail(EINVAL));
    }

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) return {};
    if (errno != EINPROGRESS) return std::unexpected(fail(errno));

    if (auto ready = wait_for(POLLOUT, timeout_ms); !ready) return ready;

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return std::unexpected(fail(errno));
    }
    if (err != 0) return std::unexpected(fail(err));
    return {};
}

std::expected<void, IoError> TcpSocketClient::send(const std::string& data, int timeout_ms) {
    if (fd_ < 0) return std::unexpected(IoError::Closed);

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (auto ready = wait_for(POLLOUT, remaining_ms(deadline)); !ready) return ready;
            continue;
        }
        if (n < 0 && errno == EPIPE) return std::unexpected(IoError::Closed);
        return std::unexpected(fail(errno));
    }
    return {};
}

std::expected<std::string, IoError> TcpSocketClient::recv_line(int timeout_ms) {
    if (fd_ < 0) return std::unexpected(IoError::Closed);

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (auto line = in_.next_line()) return std::move(*line);

        if (auto ready = wait_for(POLLIN, remaining_ms(deadline)); !ready) {
            return std::unexpected(ready.error());
        }

        char buf[4096];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            in_.append(std::string_view(buf, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) return std::unexpected(IoError::Closed);
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        if (errno == ECONNRESET) return std::unexpected(IoError::Closed);
        return std::unexpected(fail(errno));
    }
}

void TcpSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    in_.clear();
}
