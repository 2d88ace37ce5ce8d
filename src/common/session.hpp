#pragma once

#include "whatsapp_types.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SessionStatus { Disconnected, Initializing, Qr, Authenticated, Ready, Error };

std::string_view to_string(SessionStatus status);
std::optional<SessionStatus> session_status_from_string(std::string_view s);

enum class SessionEventKind {
    Qr,
    Authenticated,
    Ready,
    Disconnected,
    Error,
    Message,
    MessageCreate,
    Status,
};

struct SessionEvent {
    SessionEventKind kind;
    std::string detail;             // qr payload, error text or disconnect reason
    std::optional<Message> message; // Message / MessageCreate
    SessionStatus status = SessionStatus::Disconnected; // Status
};

// One authenticated WhatsApp connection. Implementations serialize their own
// access to the automation layer; callers may use a session from several
// threads at once without extra locking.
class Session {
public:
    using EventHandler = std::function<void(const SessionEvent&)>;

    virtual ~Session() = default;

    // Starts connecting. Returns once the attempt is under way; readiness is
    // reported through events.
    virtual std::expected<void, std::string> initialize() = 0;
    virtual void destroy() = 0;
    virtual SessionStatus status() const = 0;

    // Replaces the handler. Events may be delivered on any thread.
    virtual void set_event_handler(EventHandler handler) = 0;

    virtual std::expected<std::vector<Thread>, std::string> get_threads() = 0;
    virtual std::expected<std::vector<SearchResult>, std::string>
        search_threads(const std::string& query) = 0;
    virtual std::expected<std::optional<Thread>, std::string>
        find_chat_by_name(const std::string& name) = 0;
    virtual std::expected<std::vector<Message>, std::string>
        get_messages(const std::string& chat_id, std::optional<int> limit) = 0;
    virtual std::expected<void, std::string>
        send_message(const std::string& chat_id, const std::string& text) = 0;
    virtual std::expected<void, std::string>
        send_file(const std::string& chat_id, const std::string& file_path,
                  const std::string& caption) = 0;
    virtual std::expected<void, std::string>
        reply_to_message(const std::string& message_id, const std::string& text) = 0;

    // Best effort; failures are logged by the implementation.
    virtual void mark_as_read(const std::string& chat_id) = 0;
};
