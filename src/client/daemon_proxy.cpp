#include "daemon_proxy.hpp"

#include "platform/linux/tcp_socket_client.hpp"

#include <atomic>
#include <format>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string next_request_id() {
    static std::atomic<uint64_t> counter{0};
    return std::format("{}-{}", ::getpid(), ++counter);
}

} // namespace

std::expected<json, IpcError> call_daemon(uint16_t port, const std::string& token,
                                          rpc::Method method, const json& params,
                                          std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    auto name = std::string(rpc::to_string(method));
    auto deadline = Clock::now() + timeout;
    auto remaining = [&deadline] {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    TcpSocketClient client;
    auto fail = [&](IoError err) {
        switch (err) {
            case IoError::Timeout:
                return IpcError{name, std::format("IPC call \"{}\" timed out after {} ms", name,
                                                  timeout.count())};
            case IoError::Closed:
                return IpcError{name, std::format("Socket closed before response for \"{}\"", name)};
            case IoError::Failed:
                break;
        }
        return IpcError{name, std::format("IPC call \"{}\" failed: {}", name, client.last_error())};
    };

    if (auto connected = client.connect("127.0.0.1", port, remaining()); !connected) {
        return std::unexpected(fail(connected.error()));
    }

    auto id = next_request_id();
    if (auto sent = client.send(rpc::encode(rpc::make_request(id, method, params, token)),
                                remaining());
        !sent) {
        return std::unexpected(fail(sent.error()));
    }

    while (true) {
        auto line = client.recv_line(remaining());
        if (!line) return std::unexpected(fail(line.error()));

        json response;
        try {
            response = json::parse(*line);
        } catch (const json::exception&) {
            continue;
        }
        if (!response.is_object() || !response.contains("id") || response["id"] != id) continue;

        if (response.contains("error") && !response["error"].is_null()) {
            auto& err = response["error"];
            return std::unexpected(IpcError{name, err.is_string() ? err.get<std::string>()
                                                                  : err.dump()});
        }
        return response.contains("result") ? response["result"] : json(nullptr);
    }
}

DaemonProxy::DaemonProxy(uint16_t port, std::string token, Timeouts timeouts, LogSink& sink)
    : port_(port), token_(std::move(token)), timeouts_(timeouts), log_(sink, "DaemonProxy") {}

std::chrono::milliseconds DaemonProxy::timeout_for(rpc::Method method) const {
    switch (method) {
        case rpc::Method::GetThreads:
        case rpc::Method::GetMessages:
        case rpc::Method::SendFile:
            return timeouts_.long_call;
        default:
            return timeouts_.call;
    }
}

std::expected<json, std::string> DaemonProxy::call(rpc::Method method, const json& params) const {
    auto result = call_daemon(port_, token_, method, params, timeout_for(method));
    if (!result) {
        log_.debug(result.error().message);
        return std::unexpected(result.error().message);
    }
    return std::move(*result);
}

template <typename T>
std::expected<T, std::string> DaemonProxy::call_as(rpc::Method method, const json& params) const {
    auto result = call(method, params);
    if (!result) return std::unexpected(result.error());
    try {
        return result->template get<T>();
    } catch (const json::exception& e) {
        return std::unexpected(
            std::format("Bad response for \"{}\": {}", rpc::to_string(method), e.what()));
    }
}

SessionStatus DaemonProxy::status() const {
    auto result = call(rpc::Method::GetStatus, nullptr);
    if (!result || !result->is_string()) return SessionStatus::Disconnected;
    return session_status_from_string(result->get<std::string>())
        .value_or(SessionStatus::Disconnected);
}

std::expected<std::vector<Thread>, std::string> DaemonProxy::get_threads() {
    return call_as<std::vector<Thread>>(rpc::Method::GetThreads, nullptr);
}

std::expected<std::vector<SearchResult>, std::string>
DaemonProxy::search_threads(const std::string& query) {
    return call_as<std::vector<SearchResult>>(rpc::Method::SearchThreads, {{"query", query}});
}

std::expected<std::optional<Thread>, std::string>
DaemonProxy::find_chat_by_name(const std::string& name) {
    auto result = call(rpc::Method::FindChatByName, {{"name", name}});
    if (!result) return std::unexpected(result.error());
    if (result->is_null()) return std::optional<Thread>{};
    try {
        return std::optional<Thread>(result->get<Thread>());
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Bad response for \"findChatByName\": ") + e.what());
    }
}

std::expected<std::vector<Message>, std::string>
DaemonProxy::get_messages(const std::string& chat_id, std::optional<int> limit) {
    json params = {{"chatId", chat_id}};
    if (limit) params["limit"] = *limit;
    return call_as<std::vector<Message>>(rpc::Method::GetMessages, params);
}

std::expected<void, std::string>
DaemonProxy::send_message(const std::string& chat_id, const std::string& text) {
    auto result = call(rpc::Method::SendMessage, {{"chatId", chat_id}, {"text", text}});
    if (!result) return std::unexpected(result.error());
    return {};
}

std::expected<void, std::string>
DaemonProxy::send_file(const std::string& chat_id, const std::string& file_path,
                       const std::string& caption) {
    auto result = call(rpc::Method::SendFile,
                       {{"chatId", chat_id}, {"filePath", file_path}, {"caption", caption}});
    if (!result) return std::unexpected(result.error());
    return {};
}

std::expected<void, std::string>
DaemonProxy::reply_to_message(const std::string& message_id, const std::string& text) {
    auto result = call(rpc::Method::ReplyToMessage, {{"messageId", message_id}, {"text", text}});
    if (!result) return std::unexpected(result.error());
    return {};
}

void DaemonProxy::mark_as_read(const std::string& chat_id) {
    log_.debug("markAsRead is not forwarded to the daemon (" + chat_id + ")");
}
