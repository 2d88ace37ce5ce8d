#include "platform/linux/tcp_socket_server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <unistd.h>

TcpSocketServer::TcpSocketServer() = default;

TcpSocketServer::~TcpSocketServer() {
    stop();
}

bool TcpSocketServer::start(const std::string& host, uint16_t port) {
    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    int one = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        std::println(stderr, "ipc: invalid listen address {}", host);
        close_listener();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        close_listener();
        return false;
    }

    if (::listen(server_fd_, SOMAXCONN) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        close_listener();
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        std::println(stderr, "ipc: getsockname() failed: {}", std::strerror(errno));
        close_listener();
        return false;
    }
    port_ = ntohs(addr.sin_port);
    return true;
}

void TcpSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();
    close_listener();
}

void TcpSocketServer::close_listener() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

int TcpSocketServer::accept_client() {
    if (server_fd_ < 0) return -1;
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({.fd = fd, .id = ++next_conn_id_, .in = {}, .out = {}});
    return fd;
}

std::optional<IpcServer::ConnId> TcpSocketServer::conn_id(int client_fd) const {
    auto* client = find_client(client_fd);
    if (!client) return std::nullopt;
    return client->id;
}

int TcpSocketServer::fd_for(ConnId id) const {
    auto it = std::ranges::find_if(clients_, [id](const Client& c) { return c.id == id; });
    return it != clients_.end() ? it->fd : -1;
}

bool TcpSocketServer::read_lines(int client_fd, std::vector<std::string>& lines) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    // Lines that arrive together with EOF are still handed out. A partial
    // line longer than rpc::MAX_LINE_BYTES drops the connection.
    bool alive = true;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client->in.append(std::string_view(buf, static_cast<size_t>(n)));
            while (auto line = client->in.next_line()) {
                lines.push_back(std::move(*line));
            }
            if (client->in.pending_bytes() > rpc::MAX_LINE_BYTES) {
                std::println(stderr, "ipc: dropping client {}: line exceeds {} bytes", client_fd,
                             rpc::MAX_LINE_BYTES);
                client->in.clear();
                return false;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        alive = false;
        break;
    }
    return alive;
}

bool TcpSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    auto* client = find_client(client_fd);
    if (!client) return false;
    client->out += rpc::encode(response);
    return flush(client_fd);
}

bool TcpSocketServer::flush(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    size_t sent = 0;
    bool ok = true;
    while (sent < client->out.size()) {
        ssize_t n = ::send(client_fd, client->out.data() + sent, client->out.size() - sent,
                           MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        ok = false;
        break;
    }
    client->out.erase(0, sent);
    if (!ok) client->out.clear();
    return ok;
}

bool TcpSocketServer::has_pending_output(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && !client->out.empty();
}

void TcpSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const Client& c) { return c.fd == client_fd; });
}

void TcpSocketServer::flush_all(std::chrono::milliseconds budget) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (true) {
        std::vector<pollfd> waiting;
        for (auto& c : clients_) {
            if (!c.out.empty()) waiting.push_back({.fd = c.fd, .events = POLLOUT, .revents = 0});
        }
        if (waiting.empty()) return;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return;

        int ret = ::poll(waiting.data(), waiting.size(), static_cast<int>(left.count()));
        if (ret < 0 && errno != EINTR) return;

        for (auto& p : waiting) {
            if (p.revents == 0) continue;
            if (!flush(p.fd)) {
                if (auto* c = find_client(p.fd)) c->out.clear();
            }
        }
    }
}

TcpSocketServer::Client* TcpSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

const TcpSocketServer::Client* TcpSocketServer::find_client(int fd) const {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
