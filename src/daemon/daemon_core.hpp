#pragma once

#include "logger.hpp"
#include "rpc/protocol.hpp"
#include "session.hpp"

#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Authentication and dispatch of daemon RPCs. Owns no sockets: the event loop
// feeds it lines and ships back whatever it returns.
class DaemonCore {
public:
    DaemonCore(Session& session, std::string token, LogSink& sink);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Handles everything that can be answered on the loop thread. Returns the
    // response, or nullopt when `request` names a session call
    // (rpc::touches_session) that must be run through execute() on a worker.
    std::optional<nlohmann::json> accept(const std::string& line, nlohmann::json& request);

    // Runs an accepted session call. Thread-safe; never throws.
    nlohmann::json execute(const nlohmann::json& request);

    bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

    // Destroys the session, failing whatever calls are still in flight.
    void shutdown();

private:
    nlohmann::json dispatch(rpc::Method method, const nlohmann::json& params);

    Session& session_;
    std::string token_;
    Logger log_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> shut_down_{false};
};
