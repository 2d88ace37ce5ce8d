#pragma once

#include "logger.hpp"
#include "rpc/protocol.hpp"
#include "session.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct IpcError {
    std::string method;
    std::string message;
};

// One request/response exchange on a fresh loopback connection. `timeout`
// covers connect, write and read together. Lines carrying other ids are
// skipped.
std::expected<nlohmann::json, IpcError> call_daemon(uint16_t port, const std::string& token,
                                                    rpc::Method method,
                                                    const nlohmann::json& params,
                                                    std::chrono::milliseconds timeout);

// Session whose every operation is an RPC to a running daemon. It holds no
// connection between calls.
class DaemonProxy : public Session {
public:
    struct Timeouts {
        std::chrono::milliseconds call = std::chrono::seconds(30);
        // getThreads, getMessages and sendFile
        std::chrono::milliseconds long_call = std::chrono::seconds(60);
    };

    DaemonProxy(uint16_t port, std::string token, Timeouts timeouts, LogSink& sink);

    uint16_t port() const { return port_; }

    // The daemon is already connected; nothing to start.
    std::expected<void, std::string> initialize() override { return {}; }
    // The daemon outlives this process.
    void destroy() override {}
    SessionStatus status() const override;
    void set_event_handler(EventHandler handler) override { handler_ = std::move(handler); }

    std::expected<std::vector<Thread>, std::string> get_threads() override;
    std::expected<std::vector<SearchResult>, std::string>
        search_threads(const std::string& query) override;
    std::expected<std::optional<Thread>, std::string>
        find_chat_by_name(const std::string& name) override;
    std::expected<std::vector<Message>, std::string>
        get_messages(const std::string& chat_id, std::optional<int> limit) override;
    std::expected<void, std::string>
        send_message(const std::string& chat_id, const std::string& text) override;
    std::expected<void, std::string>
        send_file(const std::string& chat_id, const std::string& file_path,
                  const std::string& caption) override;
    std::expected<void, std::string>
        reply_to_message(const std::string& message_id, const std::string& text) override;
    void mark_as_read(const std::string& chat_id) override;

    std::expected<nlohmann::json, std::string> call(rpc::Method method,
                                                    const nlohmann::json& params) const;

private:
    template <typename T>
    std::expected<T, std::string> call_as(rpc::Method method, const nlohmann::json& params) const;

    std::chrono::milliseconds timeout_for(rpc::Method method) const;

    uint16_t port_;
    std::string token_;
    Timeouts timeouts_;
    Logger log_;
    EventHandler handler_; // the daemon does not forward events
};
