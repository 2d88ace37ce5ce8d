#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "session.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <utility>
#include <vector>

// Session backed by an automation helper process (whatsapp-web.js or similar)
// that speaks newline-delimited JSON on its stdin/stdout:
//   -> {"id":"7","method":"getThreads","params":{}}
//   <- {"id":"7","result":[...]}  |  {"id":"7","error":"..."}
//   <- {"event":"ready"}          |  {"event":"qr","data":"..."}
class BridgeSession : public Session {
public:
    struct Options {
        std::vector<std::string> command;
        // Added to (or overriding) the inherited environment.
        std::vector<std::pair<std::string, std::string>> env;
        std::chrono::milliseconds destroy_grace = std::chrono::seconds(5);
    };

    BridgeSession(Options options, LogSink& sink);
    ~BridgeSession() override;

    BridgeSession(const BridgeSession&) = delete;
    BridgeSession& operator=(const BridgeSession&) = delete;

    std::expected<void, std::string> initialize() override;
    void destroy() override;
    SessionStatus status() const override;
    void set_event_handler(EventHandler handler) override;

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

private:
    using Reply = std::expected<nlohmann::json, std::string>;
    using Completion = std::function<void(Reply)>;

    static constexpr int DEFAULT_MESSAGE_LIMIT = 50;

    // Blocks until the helper answers or goes away.
    Reply call(std::string_view method, nlohmann::json params);
    bool send_request(std::string_view method, nlohmann::json params, Completion done);

    void reader_main(std::stop_token stop);
    void handle_line(const std::string& line);
    void handle_event(const std::string& name, const nlohmann::json& data);
    void on_bridge_exit();

    void set_status(SessionStatus status);
    void emit(const SessionEvent& ev);
    void fail_pending(const std::string& reason);
    std::expected<std::vector<Thread>, std::string> cached_threads();
    void reap_child();

    Options options_;
    Logger log_;

    mutable std::mutex mutex_;
    SessionStatus status_ = SessionStatus::Disconnected;
    EventHandler handler_;
    std::map<std::string, Completion> pending_;
    uint64_t next_id_ = 0;
    bool running_ = false;
    std::vector<Thread> threads_cache_;

    std::mutex write_mutex_;
    pid_t child_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::jthread reader_;
};

// Helper command line and environment (WA_AUTH_DIR, WA_BROWSER_PATH) from the
// user's configuration.
BridgeSession::Options bridge_options(const Config& config);
