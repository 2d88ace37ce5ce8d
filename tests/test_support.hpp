#pragma once

#include "logger.hpp"
#include "rpc/protocol.hpp"
#include "session.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

// RAII temp directory that auto-deletes.
struct TmpDir {
    std::string path;

    TmpDir() {
        auto tmpl = (std::filesystem::temp_directory_path() / "wa_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data())) path.assign(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return path + "/" + name; }
};

inline Message make_message(std::string id, std::string body, std::string thread_id) {
    Message m;
    m.id = std::move(id);
    m.type = "chat";
    m.body = std::move(body);
    m.thread_id = std::move(thread_id);
    m.from = m.thread_id;
    m.timestamp = *iso8601::parse("2024-05-01T09:30:00.250Z");
    return m;
}

inline Thread make_thread(std::string id, std::string name, bool is_group = false) {
    Thread t;
    t.id = std::move(id);
    t.name = std::move(name);
    t.is_group = is_group;
    t.timestamp = iso8601::parse("2024-05-01T09:30:00.250Z");
    return t;
}

// In-memory Session. Records every mutating call so tests can assert that
// nothing reached the session.
class FakeSession : public Session {
public:
    FakeSession() {
        threads = {make_thread("1@c.us", "Alice"), make_thread("2@g.us", "Team Rocket", true)};
        threads[0].last_message = make_message("m1", "hi there", "1@c.us");
        messages = {make_message("m1", "hi there", "1@c.us"),
                    make_message("m2", "how are you?", "1@c.us")};
    }

    std::expected<void, std::string> initialize() override {
        initialize_calls++;
        if (init_error) return std::unexpected(*init_error);
        if (on_initialize) on_initialize(*this);
        return {};
    }

    void destroy() override {
        {
            std::lock_guard lock(mutex_);
            destroyed_ = true;
        }
        cv_.notify_all();
        destroy_calls++;
        if (on_destroy) on_destroy();
    }

    SessionStatus status() const override { return status_value.load(); }

    void set_event_handler(EventHandler handler) override {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    bool has_handler() {
        std::lock_guard lock(mutex_);
        return static_cast<bool>(handler_);
    }

    void emit(const SessionEvent& ev) {
        EventHandler handler;
        {
            std::lock_guard lock(mutex_);
            handler = handler_;
        }
        if (handler) handler(ev);
    }

    std::expected<std::vector<Thread>, std::string> get_threads() override {
        session_calls++;
        if (threads_delay.count() > 0) {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, threads_delay, [this] { return destroyed_; });
            if (destroyed_) return std::unexpected("Session destroyed");
        }
        return threads;
    }

    std::expected<std::vector<SearchResult>, std::string>
    search_threads(const std::string& query) override {
        session_calls++;
        last_query = query;
        std::vector<SearchResult> out;
        for (auto& t : threads) {
            if (t.name.find(query) != std::string::npos) out.push_back({t, 0.75});
        }
        return out;
    }

    std::expected<std::optional<Thread>, std::string>
    find_chat_by_name(const std::string& name) override {
        session_calls++;
        for (auto& t : threads) {
            if (t.name == name) return t;
        }
        return std::optional<Thread>{};
    }

    std::expected<std::vector<Message>, std::string>
    get_messages(const std::string& chat_id, std::optional<int> limit) override {
        session_calls++;
        last_limit = limit;
        if (chat_id != "1@c.us") return std::unexpected("Chat not found: " + chat_id);
        return messages;
    }

    std::expected<void, std::string>
    send_message(const std::string& chat_id, const std::string& text) override {
        session_calls++;
        if (chat_id == "fail@c.us") return std::unexpected("Evaluation failed: send refused");
        record("send:" + chat_id + ":" + text);
        return {};
    }

    std::expected<void, std::string>
    send_file(const std::string& chat_id, const std::string& file_path,
              const std::string& caption) override {
        session_calls++;
        record("file:" + chat_id + ":" + file_path + ":" + caption);
        return {};
    }

    std::expected<void, std::string>
    reply_to_message(const std::string& message_id, const std::string& text) override {
        session_calls++;
        record("reply:" + message_id + ":" + text);
        return {};
    }

    void mark_as_read(const std::string& chat_id) override { record("read:" + chat_id); }

    std::vector<std::string> side_effects() {
        std::lock_guard lock(mutex_);
        return effects_;
    }

    std::vector<Thread> threads;
    std::vector<Message> messages;
    std::optional<std::string> init_error;
    std::function<void(FakeSession&)> on_initialize;
    std::function<void()> on_destroy;
    std::chrono::milliseconds threads_delay{0};
    std::atomic<SessionStatus> status_value{SessionStatus::Ready};
    std::atomic<int> initialize_calls{0};
    std::atomic<int> destroy_calls{0};
    std::atomic<int> session_calls{0};
    std::string last_query;
    std::optional<int> last_limit;

private:
    void record(std::string effect) {
        std::lock_guard lock(mutex_);
        effects_.push_back(std::move(effect));
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool destroyed_ = false;
    EventHandler handler_;
    std::vector<std::string> effects_;
};

// Blocking loopback client speaking raw lines, for protocol-level tests.
class RawConnection {
public:
    explicit RawConnection(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        timeval tv{.tv_sec = 5, .tv_usec = 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~RawConnection() { close(); }

    RawConnection(const RawConnection&) = delete;
    RawConnection& operator=(const RawConnection&) = delete;

    bool connected() const { return connected_; }

    bool send_raw(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    bool send_json(const nlohmann::json& j) { return send_raw(rpc::encode(j)); }

    // nullopt on timeout or EOF.
    std::optional<nlohmann::json> read_json() {
        while (true) {
            if (auto line = in_.next_line()) return nlohmann::json::parse(*line);
            char buf[4096];
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n <= 0) return std::nullopt;
            in_.append(std::string_view(buf, static_cast<size_t>(n)));
        }
    }

    // True once the peer has closed the connection.
    bool at_eof() {
        char c;
        return ::recv(fd_, &c, 1, 0) == 0;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
    bool connected_ = false;
    rpc::LineBuffer in_;
};

// Port on 127.0.0.1 that nothing listens on (bound, then released).
inline uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

// Scripted peer: accepts up to `connections` clients one after another, reads
// one line from each and answers with whatever `reply` returns (empty = close
// without answering).
class ScriptedServer {
public:
    explicit ScriptedServer(std::function<std::string(const std::string&)> reply,
                            bool accept_connections = true, int connections = 1) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 4);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        if (!accept_connections) return;
        thread_ = std::jthread([this, connections, reply = std::move(reply)] {
            for (int i = 0; i < connections; i++) {
                int client = ::accept(fd_, nullptr, nullptr);
                if (client < 0) return;
                rpc::LineBuffer in;
                std::optional<std::string> line;
                char buf[4096];
                while (!(line = in.next_line())) {
                    ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                    if (n <= 0) break;
                    in.append(std::string_view(buf, static_cast<size_t>(n)));
                }
                if (line) {
                    received = *line;
                    auto out = reply(*line);
                    if (!out.empty()) ::send(client, out.data(), out.size(), MSG_NOSIGNAL);
                }
                ::close(client);
            }
        });
    }

    ~ScriptedServer() {
        ::shutdown(fd_, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    uint16_t port() const { return port_; }

    std::string received;

private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::jthread thread_;
};
