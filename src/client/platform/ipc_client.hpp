#pragma once

#include <cstdint>
#include <expected>
#include <string>

enum class IoError { Timeout, Closed, Failed };

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual std::expected<void, IoError> connect(const std::string& host, uint16_t port,
                                                 int timeout_ms) = 0;
    virtual std::expected<void, IoError> send(const std::string& data, int timeout_ms) = 0;
    // Next non-blank line, without its terminator.
    virtual std::expected<std::string, IoError> recv_line(int timeout_ms) = 0;
    virtual void close() = 0;
    // strerror() text behind the last IoError::Failed.
    virtual const std::string& last_error() const = 0;
};
