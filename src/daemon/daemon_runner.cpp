#include "daemon_runner.hpp"

#include "boot.hpp"
#include "daemon_core.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "state_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <stop_token>
#include <thread>
#include <unistd.h>

namespace {

void log_session_events(Session& session, Logger log) {
    session.set_event_handler([log](const SessionEvent& ev) {
        switch (ev.kind) {
            case SessionEventKind::Disconnected:
                log.warn("Session disconnected: " + ev.detail);
                break;
            case SessionEventKind::Error:
                log.error("Session error: " + ev.detail);
                break;
            case SessionEventKind::Status:
                log.debug(std::format("Session status: {}", to_string(ev.status)));
                break;
            case SessionEventKind::Message:
                if (ev.message) log.debug("Incoming message in " + ev.message->thread_id);
                break;
            default:
                break;
        }
    });
}

// Consumes SIGINT/SIGTERM while the session boots; the event loop's signalfd
// takes over once serving.
std::expected<void, BootFailure> boot_session(Session& session, const Config& config,
                                              Logger& log) {
    std::stop_source interrupted;
    std::atomic<int> signo{0};
    std::jthread watcher([&interrupted, &signo](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (int sig = platform::wait_termination_signal(std::chrono::milliseconds(200))) {
                signo = sig;
                interrupted.request_stop();
                return;
            }
        }
    });

    BootOptions boot;
    boot.timeout = std::chrono::seconds(config.daemon.boot_timeout_s);
    boot.not_logged_in_message = "Not logged in – run:  wa auth login";
    boot.stop = interrupted.get_token();

    auto ready = wait_until_ready(session, boot);
    watcher.request_stop();
    watcher.join();

    if (signo != 0) {
        log.info(std::format("Received signal {} during boot", signo.load()));
        if (ready) {
            return std::unexpected(
                BootFailure{BootFailureKind::Cancelled, "Interrupted while waiting for WhatsApp"});
        }
    }
    return ready;
}

} // namespace

int run_daemon(Session& session, const Config& config, const std::string& token, LogSink& sink) {
    Logger log(sink, "Daemon");

    std::println("Starting WhatsApp session…");
    std::fflush(stdout);

    if (auto ready = boot_session(session, config, log); !ready) {
        log.error(ready.error().message);
        std::println(stderr, "{}", ready.error().message);
        session.destroy();
        return 1;
    }
    log_session_events(session, log);

    DaemonCore core(session, token, sink);
    LinuxEventLoop loop(core, sink);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        core.shutdown();
        return 1;
    }

    // A signal between the end of the boot wait and the signalfd is still
    // pending; never publish for a daemon that was told to go.
    if (int sig = platform::wait_termination_signal(std::chrono::milliseconds(0))) {
        log.info(std::format("Received signal {} before serving, shutting down", sig));
        core.shutdown();
        return 1;
    }

    StateStore store(config.state_file());
    if (auto published = loop.publish(store, token); !published) {
        log.error("Could not write daemon state: " + published.error());
        std::println(stderr, "Could not write daemon state: {}", published.error());
        core.shutdown();
        return 1;
    }

    std::println("Daemon ready – port {} (pid {})", loop.port(), ::getpid());
    std::fflush(stdout);

    loop.run();
    return 0;
}
