#include "connect.hpp"

#include <format>

ConnectOptions connect_options(const Config& config) {
    ConnectOptions opts;
    opts.probe_timeout = std::chrono::milliseconds(config.daemon.probe_timeout_ms);
    opts.call_timeouts.call = std::chrono::milliseconds(config.daemon.call_timeout_ms);
    opts.call_timeouts.long_call = std::chrono::milliseconds(config.daemon.long_call_timeout_ms);
    opts.boot.timeout = std::chrono::seconds(config.daemon.boot_timeout_s);
    return opts;
}

std::unique_ptr<DaemonProxy> try_connect_daemon(const StateStore& store,
                                                const ConnectOptions& options, LogSink& sink) {
    auto desc = store.read();
    if (!desc) return nullptr;

    auto pong = call_daemon(desc->port, desc->token, rpc::Method::Ping, nullptr,
                            options.probe_timeout);
    if (!pong || *pong != "pong") {
        Logger(sink, "Connect").debug(std::format("Daemon on port {} did not answer ping: {}",
                                                  desc->port,
                                                  pong ? pong->dump() : pong.error().message));
        return nullptr;
    }
    return std::make_unique<DaemonProxy>(desc->port, desc->token, options.call_timeouts, sink);
}

std::expected<SessionHandle, BootFailure> connect_session(const StateStore& store,
                                                          const SessionFactory& factory,
                                                          const ConnectOptions& options,
                                                          LogSink& sink) {
    if (auto proxy = try_connect_daemon(store, options, sink)) {
        return SessionHandle(std::move(proxy), true);
    }

    Logger log(sink, "Connect");
    log.debug("No daemon reachable, starting a private session");

    auto session = factory();
    if (!session) {
        return std::unexpected(BootFailure{BootFailureKind::Upstream, "No session available"});
    }
    SessionHandle handle(std::move(session), false);
    if (auto ready = wait_until_ready(*handle, options.boot); !ready) {
        log.warn(ready.error().message);
        return std::unexpected(ready.error());
    }
    return handle;
}
