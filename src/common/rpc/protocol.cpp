#include "rpc/protocol.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <sys/random.h>

namespace rpc {

namespace {

struct MethodName {
    Method method;
    std::string_view name;
};

constexpr std::array<MethodName, 10> METHODS = {{
    {Method::Ping, "ping"},
    {Method::GetStatus, "getStatus"},
    {Method::GetThreads, "getThreads"},
    {Method::SearchThreads, "searchThreads"},
    {Method::FindChatByName, "findChatByName"},
    {Method::GetMessages, "getMessages"},
    {Method::SendMessage, "sendMessage"},
    {Method::SendFile, "sendFile"},
    {Method::ReplyToMessage, "replyToMessage"},
    {Method::Stop, "stop"},
}};

} // namespace

std::optional<Method> method_from_string(std::string_view name) {
    for (auto& m : METHODS) {
        if (m.name == name) return m.method;
    }
    return std::nullopt;
}

std::string_view to_string(Method method) {
    for (auto& m : METHODS) {
        if (m.method == method) return m.name;
    }
    return "unknown";
}

bool touches_session(Method method) {
    switch (method) {
        case Method::Ping:
        case Method::GetStatus:
        case Method::Stop:
            return false;
        default:
            return true;
    }
}

std::optional<std::string> LineBuffer::next_line() {
    while (true) {
        auto pos = buf_.find('\n');
        if (pos == std::string::npos) return std::nullopt;

        std::string line = buf_.substr(0, pos);
        buf_.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        return line;
    }
}

nlohmann::json make_request(const std::string& id, Method method,
                            const nlohmann::json& params, const std::string& token) {
    nlohmann::json req = {{"id", id}, {"method", to_string(method)}, {"token", token}};
    if (!params.is_null()) req["params"] = params;
    return req;
}

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"id", id}, {"result", std::move(result)}};
}

nlohmann::json make_error(const nlohmann::json& id, const std::string& message) {
    return {{"id", id}, {"error", message}};
}

std::string encode(const nlohmann::json& message) {
    // Replace invalid UTF-8 rather than throwing from dump().
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

bool constant_time_equals(std::string_view given, std::string_view expected) {
    unsigned diff = given.size() == expected.size() ? 0u : 1u;
    for (size_t i = 0; i < expected.size(); ++i) {
        unsigned char g = i < given.size() ? static_cast<unsigned char>(given[i]) : 0;
        diff |= static_cast<unsigned>(g ^ static_cast<unsigned char>(expected[i]));
    }
    return diff == 0;
}

std::expected<std::string, std::string> generate_token() {
    std::array<unsigned char, TOKEN_BYTES> bytes{};
    size_t filled = 0;
    while (filled < bytes.size()) {
        ssize_t n = ::getrandom(bytes.data() + filled, bytes.size() - filled, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("getrandom() failed: ") + std::strerror(errno));
        }
        filled += static_cast<size_t>(n);
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string token;
    token.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        token.push_back(HEX[b >> 4]);
        token.push_back(HEX[b & 0x0f]);
    }
    return token;
}

} // namespace rpc
