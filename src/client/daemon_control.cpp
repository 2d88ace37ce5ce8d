#include "daemon_control.hpp"

#include "connect.hpp"
#include "iso8601.hpp"
#include "platform/daemonizer.hpp"
#include "state_store.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <print>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

std::string local_time(const std::string& iso) {
    auto tp = iso8601::parse(iso);
    if (!tp) return iso;
    std::time_t t = std::chrono::system_clock::to_time_t(*tp);
    std::tm tm{};
    if (!::localtime_r(&t, &tm)) return iso;
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return iso;
    return buf;
}

} // namespace

int daemon_start(const Config& config, const std::string& config_path, LogSink& sink) {
    Logger log(sink, "DaemonControl");
    StateStore store(config.state_file());
    auto opts = connect_options(config);

    if (try_connect_daemon(store, opts, sink)) {
        auto desc = store.read();
        std::println("Daemon is running – pid {}, port {}  (stop with: wa daemon stop)",
                     desc ? desc->pid : 0, desc ? desc->port : 0);
        return 0;
    }

    if (store.read()) {
        log.info("Removing stale state file " + store.path());
        store.remove();
    }

    std::vector<std::string> argv = {config.daemon_executable(), "--foreground"};
    if (!config_path.empty()) {
        argv.push_back("--config");
        argv.push_back(config_path);
    }

    std::println("Starting daemon…");
    if (!platform::spawn_detached(argv)) {
        std::println(stderr, "Error: could not start {}", argv.front());
        return 1;
    }
    log.info("Spawned " + argv.front());

    std::println("Waiting for WhatsApp session…");
    auto timeout = std::chrono::seconds(config.daemon.start_timeout_s);
    auto poll = std::chrono::milliseconds(config.daemon.start_poll_ms);
    auto deadline = Clock::now() + timeout;

    while (Clock::now() < deadline) {
        std::this_thread::sleep_for(poll);
        if (try_connect_daemon(store, opts, sink)) {
            auto desc = store.read();
            std::println("Daemon is running – pid {}, port {}  (stop with: wa daemon stop)",
                         desc ? desc->pid : 0, desc ? desc->port : 0);
            return 0;
        }
    }

    std::println(stderr, "Error: Daemon did not become ready within {} s", timeout.count());
    return 1;
}

int daemon_stop(const Config& config, LogSink& sink) {
    Logger log(sink, "DaemonControl");
    StateStore store(config.state_file());
    auto opts = connect_options(config);

    auto desc = store.read();
    if (!desc) {
        std::println("Daemon is not running.");
        return 0;
    }

    if (!try_connect_daemon(store, opts, sink)) {
        store.remove();
        std::println("Daemon was not running (cleaned up stale state file).");
        return 0;
    }

    std::println("Stopping daemon…");
    if (auto stopped = call_daemon(desc->port, desc->token, rpc::Method::Stop, nullptr,
                                   opts.probe_timeout);
        !stopped) {
        // The daemon may close the socket while exiting; the state file decides.
        log.debug(stopped.error().message);
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(config.daemon.stop_wait_ms);
    std::error_code ec;
    while (Clock::now() < deadline && fs::exists(store.path(), ec)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
    }

    if (fs::exists(store.path(), ec)) {
        log.warn(std::format("Daemon (pid {}) still running after stop", desc->pid));
        std::println(stderr, "Error: Daemon (pid {}) did not stop within {} ms", desc->pid,
                     config.daemon.stop_wait_ms);
        return 1;
    }
    std::println("Daemon (pid {}) stopped.", desc->pid);
    return 0;
}

int daemon_status(const Config& config, LogSink& sink) {
    StateStore store(config.state_file());
    auto opts = connect_options(config);

    auto desc = store.read();
    if (!desc) {
        std::println("Daemon is not running");
        std::println("  Start it with:  wa daemon start");
        return 0;
    }

    if (!try_connect_daemon(store, opts, sink)) {
        store.remove();
        std::println("Daemon is not running (cleaned up stale state file)");
        std::println("  Start it with:  wa daemon start");
        return 0;
    }

    std::println("Daemon is running");
    std::println("  PID       : {}", desc->pid);
    std::println("  Port      : {}", desc->port);
    std::println("  Started   : {}", local_time(desc->started_at));
    std::println("  Stop with : wa daemon stop");
    return 0;
}
