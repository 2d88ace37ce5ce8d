#include "session.hpp"

std::string_view to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Disconnected: return "disconnected";
        case SessionStatus::Initializing: return "initializing";
        case SessionStatus::Qr: return "qr";
        case SessionStatus::Authenticated: return "authenticated";
        case SessionStatus::Ready: return "ready";
        case SessionStatus::Error: return "error";
    }
    return "disconnected";
}

std::optional<SessionStatus> session_status_from_string(std::string_view s) {
    if (s == "disconnected") return SessionStatus::Disconnected;
    if (s == "initializing") return SessionStatus::Initializing;
    if (s == "qr") return SessionStatus::Qr;
    if (s == "authenticated") return SessionStatus::Authenticated;
    if (s == "ready") return SessionStatus::Ready;
    if (s == "error") return SessionStatus::Error;
    return std::nullopt;
}
