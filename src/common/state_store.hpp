#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

// What a running daemon publishes so CLI invocations can find it.
struct DaemonDescriptor {
    int pid = 0;            // informational; liveness is always probed over TCP
    uint16_t port = 0;
    std::string started_at; // ISO-8601
    std::string token;      // 64 hex chars

    bool operator==(const DaemonDescriptor&) const = default;
};

// daemon.json under the data directory. Only the daemon writes it; readers
// treat anything they cannot parse as "no daemon".
class StateStore {
public:
    explicit StateStore(std::string path);

    const std::string& path() const { return path_; }

    // Temp file (mode 0600) + fsync + rename, so readers see the old file,
    // the new file, or nothing.
    std::expected<void, std::string> write(const DaemonDescriptor& desc) const;

    std::optional<DaemonDescriptor> read() const;

    // Best effort.
    void remove() const;

private:
    std::string path_;
};

// Exclusive advisory lock held by a daemon for its whole lifetime, so at most
// one daemon owns the state file.
class InstanceLock {
public:
    InstanceLock() = default;
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // Non-blocking. Fails when another process holds the lock.
    std::expected<void, std::string> acquire(const std::string& path);
    void release();
    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
