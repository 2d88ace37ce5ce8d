#pragma once

#include "boot.hpp"
#include "config.hpp"
#include "daemon_proxy.hpp"
#include "logger.hpp"
#include "session.hpp"
#include "state_store.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>

// Owns the session a command works with and destroys it on every exit path.
// For the daemon path destroy() is a no-op, so the daemon keeps running.
class SessionHandle {
public:
    SessionHandle(std::unique_ptr<Session> session, bool via_daemon)
        : session_(std::move(session)), via_daemon_(via_daemon) {}
    ~SessionHandle() { reset(); }

    SessionHandle(SessionHandle&& other) noexcept = default;
    SessionHandle& operator=(SessionHandle&& other) noexcept {
        if (this != &other) {
            reset();
            session_ = std::move(other.session_);
            via_daemon_ = other.via_daemon_;
        }
        return *this;
    }

    Session& operator*() const { return *session_; }
    Session* operator->() const { return session_.get(); }
    bool via_daemon() const { return via_daemon_; }

    void reset() {
        if (session_) {
            session_->destroy();
            session_.reset();
        }
    }

private:
    std::unique_ptr<Session> session_;
    bool via_daemon_;
};

using SessionFactory = std::function<std::unique_ptr<Session>()>;

struct ConnectOptions {
    std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(1500);
    DaemonProxy::Timeouts call_timeouts;
    BootOptions boot;
};

ConnectOptions connect_options(const Config& config);

// Fast path: a descriptor whose daemon answers ping within the probe timeout.
// A descriptor that fails the probe is left in place; callers that own the
// cleanup (daemon start/stop/status) remove it themselves.
std::unique_ptr<DaemonProxy> try_connect_daemon(const StateStore& store,
                                                const ConnectOptions& options, LogSink& sink);

// Fast path, or a private session from `factory` booted in this process.
std::expected<SessionHandle, BootFailure> connect_session(const StateStore& store,
                                                          const SessionFactory& factory,
                                                          const ConnectOptions& options,
                                                          LogSink& sink);
