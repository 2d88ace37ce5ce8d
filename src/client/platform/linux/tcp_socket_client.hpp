#pragma once

#include "platform/ipc_client.hpp"
#include "rpc/protocol.hpp"

class TcpSocketClient : public IpcClient {
public:
    TcpSocketClient();
    ~TcpSocketClient() override;

    TcpSocketClient(const TcpSocketClient&) = delete;
    TcpSocketClient& operator=(const TcpSocketClient&) = delete;

    std::expected<void, IoError> connect(const std::string& host, uint16_t port,
                                         int timeout_ms) override;
    std::expected<void, IoError> send(const std::string& data, int timeout_ms) override;
    std::expected<std::string, IoError> recv_line(int timeout_ms) override;
    void close() override;
    const std::string& last_error() const override { return last_error_; }

private:
    IoError fail(int err);
    std::expected<void, IoError> wait_for(short events, int timeout_ms);

    int fd_ = -1;
    rpc::LineBuffer in_;
    std::string last_error_;
};
