#pragma once

#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// Newline-delimited JSON-RPC between the CLI and the daemon.
//   request  {"id": "...", "method": "...", "params": {...}, "token": "..."}
//   response {"id": "...", "result": ...} | {"id": "...", "error": "..."}
namespace rpc {

enum class Method {
    Ping,
    GetStatus,
    GetThreads,
    SearchThreads,
    FindChatByName,
    GetMessages,
    SendMessage,
    SendFile,
    ReplyToMessage,
    Stop,
};

std::optional<Method> method_from_string(std::string_view name);
std::string_view to_string(Method method);

// Methods that call into the session and therefore run off the event loop.
bool touches_session(Method method);

inline constexpr size_t TOKEN_BYTES = 32;

// Longest request line a connection may buffer before it is dropped.
inline constexpr size_t MAX_LINE_BYTES = 1 << 20;

// Accumulates stream chunks and hands out complete lines in arrival order.
class LineBuffer {
public:
    void append(std::string_view chunk) { buf_.append(chunk); }

    // Next complete line without its terminator, skipping blank lines.
    std::optional<std::string> next_line();

    size_t pending_bytes() const { return buf_.size(); }
    void clear() { buf_.clear(); }

private:
    std::string buf_;
};

nlohmann::json make_request(const std::string& id, Method method,
                            const nlohmann::json& params, const std::string& token);
nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, const std::string& message);

// Serialized form plus the terminating newline.
std::string encode(const nlohmann::json& message);

// Equal-length comparison whose running time depends only on the length of
// `expected`, never on where the first mismatch is.
bool constant_time_equals(std::string_view given, std::string_view expected);

// TOKEN_BYTES of kernel randomness, lowercase hex.
std::expected<std::string, std::string> generate_token();

} // namespace rpc
