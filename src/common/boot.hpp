#pragma once

#include "session.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>

enum class BootFailureKind { NotLoggedIn, Upstream, Timeout, Cancelled };

struct BootFailure {
    BootFailureKind kind;
    std::string message;
};

struct BootOptions {
    std::chrono::milliseconds timeout = std::chrono::seconds(90);
    std::string not_logged_in_message = "Not logged in. Run:  wa auth login";
    // When set, qr events are handed here and the wait continues instead of
    // failing. Used by the interactive login flow.
    std::function<void(const std::string&)> on_qr;
    // A stop request ends the wait with BootFailureKind::Cancelled.
    std::stop_token stop;
};

// Installs an event handler, initializes `session` and waits for the first of
// qr / ready / error, a stop request or the timeout. Whichever happens first decides the
// outcome; later events are ignored. The session's handler is cleared before
// returning.
std::expected<void, BootFailure> wait_until_ready(Session& session, const BootOptions& options);
