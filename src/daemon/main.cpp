#include "bridge/bridge_session.hpp"
#include "config.hpp"
#include "daemon_runner.hpp"
#include "logger.hpp"
#include "platform/daemonizer.hpp"
#include "rpc/protocol.hpp"
#include "state_store.hpp"

#include <cstdio>
#include <print>
#include <signal.h>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: wa-daemon [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (!foreground) {
        platform::daemonize();
    }

    // Before any thread exists, so every thread inherits the mask. SIGINT and
    // SIGTERM surface through sigtimedwait while booting, then the signalfd.
    platform::block_termination_signals();
    ::signal(SIGPIPE, SIG_IGN);

    LogSink sink;
    sink.set_verbose(verbose || config.advanced.debug);
    sink.set_mirror_stderr(foreground && verbose);
    if (!sink.open(config.log_file())) {
        std::println(stderr, "Warning: could not open log file {}", config.log_file());
    }
    Logger log(sink, "Daemon");

    InstanceLock lock;
    if (auto locked = lock.acquire(config.lock_file()); !locked) {
        log.error(locked.error());
        std::println(stderr, "{}", locked.error());
        return 1;
    }

    auto token = rpc::generate_token();
    if (!token) {
        log.error(token.error());
        std::println(stderr, "{}", token.error());
        return 1;
    }

    BridgeSession session(bridge_options(config), sink);
    return run_daemon(session, config, *token, sink);
}
