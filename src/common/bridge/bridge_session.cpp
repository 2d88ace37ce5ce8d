#include "bridge/bridge_session.hpp"

#include "rpc/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <future>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string error_text(const json& data) {
    if (data.is_string()) return data.get<std::string>();
    if (data.is_object() && data.contains("message") && data["message"].is_string()) {
        return data["message"].get<std::string>();
    }
    if (data.is_null()) return {};
    return data.dump();
}

} // namespace

BridgeSession::Options bridge_options(const Config& config) {
    BridgeSession::Options opts;
    opts.command = config.bridge.command;
    opts.env.emplace_back("WA_AUTH_DIR", config.auth_dir());
    if (!config.advanced.browser_path.empty()) {
        opts.env.emplace_back("WA_BROWSER_PATH", config.advanced.browser_path);
    }
    return opts;
}

BridgeSession::BridgeSession(Options options, LogSink& sink)
    : options_(std::move(options)), log_(sink, "BridgeSession") {}

BridgeSession::~BridgeSession() {
    destroy();
}

std::expected<void, std::string> BridgeSession::initialize() {
    {
        std::lock_guard lock(mutex_);
        if (running_) return std::unexpected("session already initialized");
    }
    if (options_.command.empty()) {
        return std::unexpected("no session bridge command configured");
    }

    // A dead helper must surface as EPIPE on write, not kill the process.
    ::signal(SIGPIPE, SIG_IGN);

    // Everything the child needs is prepared before fork().
    std::vector<char*> argv;
    for (auto& a : options_.command) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        bool overridden = std::ranges::any_of(options_.env, [&](const auto& kv) {
            return entry.starts_with(kv.first + "=");
        });
        if (!overridden) env_storage.emplace_back(entry);
    }
    for (auto& [key, value] : options_.env) env_storage.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string exec_failure = rpc::encode(
        {{"event", "error"}, {"data", "cannot execute " + options_.command.front()}});

    int in_pipe[2];
    int out_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(err));
    }

    set_status(SessionStatus::Initializing);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        set_status(SessionStatus::Error);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: stdin/stdout become the pipes, stderr is inherited.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        // Tied to the forking thread: initialize() runs on a long-lived thread.
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);

        ::execvpe(argv[0], argv.data(), envp.data());
        ssize_t ignored = ::write(STDOUT_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    child_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];

    {
        std::lock_guard lock(mutex_);
        running_ = true;
    }
    log_.info(std::format("Started session bridge {} (pid {})", options_.command.front(), pid));

    reader_ = std::jthread([this](std::stop_token stop) { reader_main(stop); });

    // The helper reports readiness through events; a failed initialize call
    // is turned into an error event so boot waits can observe it. Failures
    // from fail_pending() are reported by whoever stopped the session.
    bool sent = send_request("initialize", json::object(), [this](Reply reply) {
        bool running;
        {
            std::lock_guard lock(mutex_);
            running = running_;
        }
        if (!reply && running) {
            set_status(SessionStatus::Error);
            emit({.kind = SessionEventKind::Error, .detail = reply.error()});
        }
    });
    if (!sent) {
        return std::unexpected("could not talk to the session bridge");
    }
    return {};
}

void BridgeSession::destroy() {
    bool was_running;
    {
        std::lock_guard lock(mutex_);
        was_running = running_ || child_ > 0;
    }
    if (!was_running) return;

    log_.info("Destroying session");
    send_request("destroy", json::object(), [](Reply) {});

    {
        std::lock_guard wlock(write_mutex_);
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }

    reap_child();

    if (reader_.joinable()) {
        reader_.request_stop();
        reader_.join();
    }
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }

    {
        std::lock_guard lock(mutex_);
        running_ = false;
        threads_cache_.clear();
    }
    fail_pending("Session destroyed");
    set_status(SessionStatus::Disconnected);
}

void BridgeSession::reap_child() {
    if (child_ <= 0) return;

    auto wait_for_exit = [this](std::chrono::milliseconds budget) {
        auto deadline = std::chrono::steady_clock::now() + budget;
        while (true) {
            int status;
            pid_t r = ::waitpid(child_, &status, WNOHANG);
            if (r == child_ || (r < 0 && errno != EINTR)) return true;
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    };

    if (!wait_for_exit(options_.destroy_grace)) {
        log_.warn("Session bridge did not exit, sending SIGTERM");
        ::kill(child_, SIGTERM);
        if (!wait_for_exit(std::chrono::seconds(2))) {
            ::kill(child_, SIGKILL);
            ::waitpid(child_, nullptr, 0);
        }
    }
    child_ = -1;
}

SessionStatus BridgeSession::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

void BridgeSession::set_event_handler(EventHandler handler) {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
}

BridgeSession::Reply BridgeSession::call(std::string_view method, json params) {
    auto promise = std::make_shared<std::promise<Reply>>();
    auto future = promise->get_future();

    if (!send_request(method, std::move(params),
                      [promise](Reply reply) { promise->set_value(std::move(reply)); })) {
        return std::unexpected("Session is not running");
    }
    return future.get();
}

bool BridgeSession::send_request(std::string_view method, json params, Completion done) {
    std::string id;
    {
        std::lock_guard lock(mutex_);
        if (!running_) return false;
        id = std::to_string(++next_id_);
        pending_.emplace(id, std::move(done));
    }

    std::string line = rpc::encode({{"id", id}, {"method", method}, {"params", std::move(params)}});

    bool ok = true;
    {
        std::lock_guard wlock(write_mutex_);
        if (stdin_fd_ < 0) {
            ok = false;
        } else {
            size_t written = 0;
            while (written < line.size()) {
                ssize_t n = ::write(stdin_fd_, line.data() + written, line.size() - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    ok = false;
                    break;
                }
                written += static_cast<size_t>(n);
            }
        }
    }

    if (!ok) {
        std::lock_guard lock(mutex_);
        pending_.erase(id);
    }
    return ok;
}

void BridgeSession::reader_main(std::stop_token stop) {
    rpc::LineBuffer lines;
    char buf[4096];

    while (!stop.stop_requested()) {
        pollfd pfd{.fd = stdout_fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR) continue;
            log_.error(std::format("poll() on session bridge failed: {}", std::strerror(errno)));
            on_bridge_exit();
            return;
        }
        if (ret == 0) continue;

        ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            on_bridge_exit();
            return;
        }

        lines.append(std::string_view(buf, static_cast<size_t>(n)));
        while (auto line = lines.next_line()) {
            handle_line(*line);
        }
    }
}

void BridgeSession::handle_line(const std::string& line) {
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::exception&) {
        log_.warn("Ignoring malformed line from session bridge");
        return;
    }
    if (!msg.is_object()) return;

    if (msg.contains("event") && msg["event"].is_string()) {
        handle_event(msg["event"].get<std::string>(), msg.value("data", json()));
        return;
    }

    if (!msg.contains("id") || !msg["id"].is_string()) return;

    Completion done;
    {
        std::lock_guard lock(mutex_);
        auto it = pending_.find(msg["id"].get<std::string>());
        if (it == pending_.end()) return;
        done = std::move(it->second);
        pending_.erase(it);
    }

    if (msg.contains("error") && !msg["error"].is_null()) {
        done(std::unexpected(error_text(msg["error"])));
    } else {
        done(msg.value("result", json()));
    }
}

void BridgeSession::handle_event(const std::string& name, const json& data) {
    if (name == "qr") {
        set_status(SessionStatus::Qr);
        emit({.kind = SessionEventKind::Qr, .detail = data.is_string() ? data.get<std::string>() : ""});
    } else if (name == "authenticated") {
        set_status(SessionStatus::Authenticated);
        emit({.kind = SessionEventKind::Authenticated});
    } else if (name == "ready") {
        set_status(SessionStatus::Ready);
        emit({.kind = SessionEventKind::Ready});
    } else if (name == "disconnected") {
        set_status(SessionStatus::Disconnected);
        emit({.kind = SessionEventKind::Disconnected, .detail = error_text(data)});
    } else if (name == "error" || name == "auth_failure") {
        auto text = error_text(data);
        if (name == "auth_failure") text = "Auth failure: " + text;
        set_status(SessionStatus::Error);
        emit({.kind = SessionEventKind::Error, .detail = text});
    } else if (name == "message" || name == "message_create") {
        try {
            auto msg = data.get<Message>();
            emit({.kind = name == "message" ? SessionEventKind::Message
                                            : SessionEventKind::MessageCreate,
                  .message = std::move(msg)});
        } catch (const json::exception& e) {
            log_.warn(std::format("Dropping unparseable {} event: {}", name, e.what()));
        }
    } else {
        log_.debug("Ignoring bridge event " + name);
    }
}

void BridgeSession::on_bridge_exit() {
    SessionStatus before;
    {
        std::lock_guard lock(mutex_);
        running_ = false;
        before = status_;
    }
    fail_pending("Session bridge exited");
    log_.warn("Session bridge exited");

    if (before == SessionStatus::Ready || before == SessionStatus::Disconnected) {
        set_status(SessionStatus::Disconnected);
        emit({.kind = SessionEventKind::Disconnected, .detail = "Session bridge exited"});
    } else if (before != SessionStatus::Error) {
        set_status(SessionStatus::Error);
        emit({.kind = SessionEventKind::Error,
              .detail = "Session bridge exited before the session was ready"});
    }
}

void BridgeSession::set_status(SessionStatus status) {
    {
        std::lock_guard lock(mutex_);
        if (status_ == status) return;
        status_ = status;
    }
    emit({.kind = SessionEventKind::Status, .status = status});
}

void BridgeSession::emit(const SessionEvent& ev) {
    EventHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = handler_;
    }
    if (handler) handler(ev);
}

void BridgeSession::fail_pending(const std::string& reason) {
    std::map<std::string, Completion> pending;
    {
        std::lock_guard lock(mutex_);
        pending.swap(pending_);
    }
    for (auto& [id, done] : pending) {
        done(std::unexpected(reason));
    }
}

std::expected<std::vector<Thread>, std::string> BridgeSession::get_threads() {
    auto reply = call("getThreads", json::object());
    if (!reply) return std::unexpected(reply.error());

    std::vector<Thread> threads;
    if (reply->is_array()) {
        size_t skipped = 0;
        for (auto& item : *reply) {
            try {
                auto t = item.get<Thread>();
                if (t.id.empty()) {
                    ++skipped;
                    continue;
                }
                threads.push_back(std::move(t));
            } catch (const json::exception&) {
                ++skipped;
            }
        }
        if (skipped > 0) log_.warn(std::format("Skipped {} chats that failed to parse", skipped));
    }

    std::lock_guard lock(mutex_);
    threads_cache_ = threads;
    return threads;
}

std::expected<std::vector<Thread>, std::string> BridgeSession::cached_threads() {
    {
        std::lock_guard lock(mutex_);
        if (!threads_cache_.empty()) return threads_cache_;
    }
    return get_threads();
}

std::expected<std::vector<SearchResult>, std::string>
BridgeSession::search_threads(const std::string& query) {
    auto threads = cached_threads();
    if (!threads) return std::unexpected(threads.error());

    if (query.find_first_not_of(" \t") == std::string::npos) {
        std::vector<SearchResult> all;
        for (auto& t : *threads) all.push_back({.thread = t, .score = 1.0});
        return all;
    }

    // Ranking is the helper's job.
    auto reply = call("searchThreads", {{"query", query}});
    if (!reply) return std::unexpected(reply.error());
    try {
        return reply->get<std::vector<SearchResult>>();
    } catch (const json::exception& e) {
        return std::unexpected(std::string("bad searchThreads reply: ") + e.what());
    }
}

std::expected<std::optional<Thread>, std::string>
BridgeSession::find_chat_by_name(const std::string& name) {
    auto threads = cached_threads();
    if (!threads) return std::unexpected(threads.error());

    auto wanted = lower(name);
    for (auto& t : *threads) {
        if (lower(t.name) == wanted) return t;
    }
    for (auto& t : *threads) {
        if (lower(t.name).find(wanted) != std::string::npos) return t;
    }

    auto results = search_threads(name);
    if (!results) return std::unexpected(results.error());
    if (results->empty()) return std::optional<Thread>{};
    return results->front().thread;
}

std::expected<std::vector<Message>, std::string>
BridgeSession::get_messages(const std::string& chat_id, std::optional<int> limit) {
    auto reply = call("getMessages",
                      {{"chatId", chat_id}, {"limit", limit.value_or(DEFAULT_MESSAGE_LIMIT)}});
    if (!reply) return std::unexpected(reply.error());
    try {
        return reply->get<std::vector<Message>>();
    } catch (const json::exception& e) {
        return std::unexpected(std::string("bad getMessages reply: ") + e.what());
    }
}

std::expected<void, std::string>
BridgeSession::send_message(const std::string& chat_id, const std::string& text) {
    auto reply = call("sendMessage", {{"chatId", chat_id}, {"text", text}});
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<void, std::string>
BridgeSession::send_file(const std::string& chat_id, const std::string& file_path,
                         const std::string& caption) {
    auto reply = call("sendFile", {{"chatId", chat_id}, {"filePath", file_path}, {"caption", caption}});
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<void, std::string>
BridgeSession::reply_to_message(const std::string& message_id, const std::string& text) {
    auto reply = call("replyToMessage", {{"messageId", message_id}, {"text", text}});
    if (!reply) return std::unexpected(reply.error());
    return {};
}

void BridgeSession::mark_as_read(const std::string& chat_id) {
    auto reply = call("markAsRead", {{"chatId", chat_id}});
    if (!reply) log_.error("markAsRead failed: " + reply.error());
}
