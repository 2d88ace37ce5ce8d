#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Line-oriented stream server. Clients are addressed by fd for I/O and by a
// connection id that is never reused, so late responses cannot reach a
// different client that happens to get the same fd.
class IpcServer {
public:
    using ConnId = uint64_t;

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& host, uint16_t port) = 0;
    virtual void stop() = 0;
    virtual void close_listener() = 0;
    virtual int server_fd() const = 0;
    virtual uint16_t port() const = 0;

    virtual int accept_client() = 0;
    virtual std::optional<ConnId> conn_id(int client_fd) const = 0;
    virtual int fd_for(ConnId id) const = 0;

    // Appends every complete line received so far. False once the peer has
    // gone away or the socket failed.
    virtual bool read_lines(int client_fd, std::vector<std::string>& lines) = 0;

    // Queues the response and writes as much as the socket takes.
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual bool flush(int client_fd) = 0;
    virtual bool has_pending_output(int client_fd) const = 0;
    virtual void close_client(int client_fd) = 0;
};
