#pragma once

#include "platform/ipc_server.hpp"
#include "rpc/protocol.hpp"

#include <chrono>
#include <string>
#include <vector>

class TcpSocketServer : public IpcServer {
public:
    TcpSocketServer();
    ~TcpSocketServer() override;

    TcpSocketServer(const TcpSocketServer&) = delete;
    TcpSocketServer& operator=(const TcpSocketServer&) = delete;

    // Port 0 lets the kernel pick one; port() reports it afterwards.
    bool start(const std::string& host, uint16_t port) override;
    void stop() override;
    void close_listener() override;
    int server_fd() const override { return server_fd_; }
    uint16_t port() const override { return port_; }

    int accept_client() override;
    std::optional<ConnId> conn_id(int client_fd) const override;
    int fd_for(ConnId id) const override;

    bool read_lines(int client_fd, std::vector<std::string>& lines) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    bool flush(int client_fd) override;
    bool has_pending_output(int client_fd) const override;
    void close_client(int client_fd) override;

    // Blocks until every outbox is drained, a peer fails, or `budget` runs out.
    void flush_all(std::chrono::milliseconds budget);

private:
    int server_fd_ = -1;
    uint16_t port_ = 0;
    ConnId next_conn_id_ = 0;

    struct Client {
        int fd;
        ConnId id;
        rpc::LineBuffer in;
        std::string out;
    };
    std::vector<Client> clients_;

    Client* find_client(int fd);
    const Client* find_client(int fd) const;
};
