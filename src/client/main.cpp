#include "boot.hpp"
#include "bridge/bridge_session.hpp"
#include "config.hpp"
#include "connect.hpp"
#include "daemon_control.hpp"
#include "logger.hpp"
#include "state_store.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <cstdio>
#include <optional>
#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [-v] [-c PATH] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  daemon start|stop|status               Manage the background session daemon");
    std::println(stderr, "  auth login                             Link this machine (prints the QR payload)");
    std::println(stderr, "  chats                                  List chats");
    std::println(stderr, "  search <query>                         Search chats");
    std::println(stderr, "  messages <chat> [--limit N]            Show recent messages, numbered for reply");
    std::println(stderr, "  send <chat> <text...> [--file PATH]    Send a message or a file");
    std::println(stderr, "  reply <chat> <index> <text...>         Reply to message <index>");
    std::println(stderr, "  status                                 Show the session status");
}

std::string join(const std::vector<std::string>& parts, size_t from) {
    std::string out;
    for (size_t i = from; i < parts.size(); i++) {
        if (!out.empty()) out += ' ';
        out += parts[i];
    }
    return out;
}

std::string clip(const std::string& s, size_t width) {
    return s.size() <= width ? s : s.substr(0, width);
}

std::string local_time(iso8601::TimePoint tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!::localtime_r(&t, &tm)) return {};
    char buf[64];
    if (std::strftime(buf, sizeof(buf), fmt, &tm) == 0) return {};
    return buf;
}

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

int fail(const std::string& message) {
    std::println(stderr, "Error: {}", message);
    return 1;
}

struct Cli {
    Config config;
    LogSink& sink;

    std::expected<SessionHandle, BootFailure> connect() const {
        auto factory = [this]() -> std::unique_ptr<Session> {
            return std::make_unique<BridgeSession>(bridge_options(config), sink);
        };
        std::println(stderr, "Connecting to WhatsApp…");
        return connect_session(StateStore(config.state_file()), factory,
                               connect_options(config), sink);
    }

    std::expected<Thread, std::string> find_chat(Session& session, const std::string& name) const {
        auto found = session.find_chat_by_name(name);
        if (!found) return std::unexpected(found.error());
        if (!*found) {
            return std::unexpected(
                std::format("No chat found matching \"{}\". Run: wa chats", name));
        }
        return **found;
    }
};

int cmd_chats(const Cli& cli) {
    auto session = cli.connect();
    if (!session) return fail(session.error().message);

    auto threads = (*session)->get_threads();
    if (!threads) return fail(threads.error());

    std::string line;
    for (int i = 0; i < 72; i++) line += "─";
    std::println("{}", line);
    std::println("  #       {:<28}{:<8}{}", "Name", "Unread", "Last message");
    std::println("{}", line);
    for (size_t i = 0; i < threads->size(); i++) {
        auto& t = (*threads)[i];
        auto unread = t.unread_count > 0 ? std::format("+{}", t.unread_count) : std::string();
        auto preview = t.last_message ? clip(message_preview(*t.last_message), 30) : std::string();
        auto when = t.timestamp ? "  [" + local_time(*t.timestamp, "%Y-%m-%d %H:%M") + "]"
                                : std::string();
        std::println("{:>3} {} {:<28}{:<8}{}{}", i + 1, t.is_group ? " [G]" : "    ",
                     clip(t.name, 27), unread, preview, when);
    }
    std::println("{}", line);
    std::println("{} chats", threads->size());
    return 0;
}

int cmd_search(const Cli& cli, const std::string& query) {
    auto session = cli.connect();
    if (!session) return fail(session.error().message);

    auto results = (*session)->search_threads(query);
    if (!results) return fail(results.error());
    if (results->empty()) {
        std::println("No chats match \"{}\"", query);
        return 0;
    }
    for (size_t i = 0; i < results->size(); i++) {
        auto& r = (*results)[i];
        std::println("{:>3} {} {:<28} ({:.2f})", i + 1, r.thread.is_group ? " [G]" : "    ",
                     clip(r.thread.name, 27), r.score);
    }
    return 0;
}

int cmd_messages(const Cli& cli, const std::string& chat, std::optional<int> limit) {
    auto session = cli.connect();
    if (!session) return fail(session.error().message);

    auto thread = cli.find_chat(**session, chat);
    if (!thread) return fail(thread.error());

    auto messages = (*session)->get_messages(thread->id, limit);
    if (!messages) return fail(messages.error());

    std::println("{} ({} messages)", thread->name, messages->size());
    for (size_t i = 0; i < messages->size(); i++) {
        auto& m = (*messages)[i];
        std::string who = m.from_me ? "me" : m.sender_name.value_or(m.from);
        std::println("[{}] {} {}: {}", i + 1, local_time(m.timestamp, "%m-%d %H:%M"), who,
                     message_preview(m));
    }
    (*session)->mark_as_read(thread->id);
    return 0;
}

int cmd_send(const Cli& cli, const std::string& chat, const std::string& text,
             const std::string& file) {
    if (file.empty() && text.empty()) {
        return fail("Nothing to send. Provide a message or use --file <path>");
    }

    std::string abs_path;
    if (!file.empty()) {
        std::error_code ec;
        abs_path = fs::absolute(file, ec).string();
        if (ec || !fs::exists(abs_path, ec)) return fail("File not found: " + file);
    }

    auto session = cli.connect();
    if (!session) return fail(session.error().message);

    auto thread = cli.find_chat(**session, chat);
    if (!thread) return fail(thread.error());

    if (!abs_path.empty()) {
        auto sent = (*session)->send_file(thread->id, abs_path, text);
        if (!sent) return fail(sent.error());
        std::println("✓  Sent {} → {}", fs::path(abs_path).filename().string(), thread->name);
    } else {
        auto sent = (*session)->send_message(thread->id, text);
        if (!sent) return fail(sent.error());
        std::println("✓  Message sent → {}", thread->name);
    }
    return 0;
}

int cmd_reply(const Cli& cli, const std::string& chat, const std::string& index_str,
              const std::string& text) {
    if (text.empty()) return fail("Provide the reply text after the message index");
    auto index = parse_int(index_str);
    if (!index || *index < 1) {
        return fail(std::format("\"{}\" is not a valid message index. Use a number ≥ 1", index_str));
    }

    auto session = cli.connect();
    if (!session) return fail(session.error().message);

    auto thread = cli.find_chat(**session, chat);
    if (!thread) return fail(thread.error());

    int fetch = std::max(*index, 20);
    auto messages = (*session)->get_messages(thread->id, fetch);
    if (!messages) return fail(messages.error());

    if (static_cast<size_t>(*index) > messages->size()) {
        return fail(std::format("No message at index {} (only {} messages fetched)", *index,
                                messages->size()));
    }

    auto& target = (*messages)[*index - 1];
    auto sent = (*session)->reply_to_message(target.id, text);
    if (!sent) return fail(sent.error());
    std::println("✓  Replied to [{}] in {}", *index, thread->name);
    return 0;
}

int cmd_status(const Cli& cli) {
    auto session = cli.connect();
    if (!session) return fail(session.error().message);
    std::println("Session: {} ({})", to_string((*session)->status()),
                 session->via_daemon() ? "via daemon" : "private session");
    return 0;
}

int cmd_auth_login(const Cli& cli) {
    auto opts = connect_options(cli.config);
    if (try_connect_daemon(StateStore(cli.config.state_file()), opts, cli.sink)) {
        std::println("Already logged in (the daemon is running).");
        return 0;
    }

    SessionHandle session(std::make_unique<BridgeSession>(bridge_options(cli.config), cli.sink),
                          false);
    BootOptions boot;
    boot.timeout = std::chrono::minutes(3);
    boot.on_qr = [](const std::string& payload) {
        std::println("Scan this code with WhatsApp (Linked devices → Link a device):");
        std::println("{}", payload);
        std::fflush(stdout);
    };

    std::println(stderr, "Starting WhatsApp session…");
    if (auto ready = wait_until_ready(*session, boot); !ready) {
        return fail(ready.error().message);
    }
    std::println("✓  Logged in. Session stored in {}", cli.config.auth_dir());
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string file;
    std::optional<int> limit;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = parse_int(argv[++i]);
            if (!limit || *limit < 1) return fail("--limit expects a positive number");
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    LogSink sink;
    sink.set_verbose(verbose || config.advanced.debug);
    sink.set_mirror_stderr(verbose);
    sink.open(config.log_file());

    Cli cli{.config = config, .sink = sink};
    const auto& command = args[0];

    if (command == "daemon") {
        std::string sub = args.size() > 1 ? args[1] : "";
        if (sub == "start") return daemon_start(config, config_path, sink);
        if (sub == "stop") return daemon_stop(config, sink);
        if (sub == "status") return daemon_status(config, sink);
        std::println(stderr, "Usage: {} daemon start|stop|status", argv[0]);
        return 1;
    }
    if (command == "auth") {
        if (args.size() > 1 && args[1] == "login") return cmd_auth_login(cli);
        std::println(stderr, "Usage: {} auth login", argv[0]);
        return 1;
    }
    if (command == "chats") return cmd_chats(cli);
    if (command == "search") {
        if (args.size() < 2) return fail("Usage: wa search <query>");
        return cmd_search(cli, join(args, 1));
    }
    if (command == "messages") {
        if (args.size() < 2) return fail("Usage: wa messages <chat> [--limit N]");
        return cmd_messages(cli, args[1], limit);
    }
    if (command == "send") {
        if (args.size() < 2) return fail("Usage: wa send <chat> <text...> [--file PATH]");
        return cmd_send(cli, args[1], join(args, 2), file);
    }
    if (command == "reply") {
        if (args.size() < 3) return fail("Usage: wa reply <chat> <index> <text...>");
        return cmd_reply(cli, args[1], args[2], join(args, 3));
    }
    if (command == "status") return cmd_status(cli);

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
