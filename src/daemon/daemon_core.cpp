#include "daemon_core.hpp"

#include <format>
#include <stdexcept>

using json = nlohmann::json;

namespace {

struct ParamError : std::runtime_error {
    explicit ParamError(const std::string& name)
        : std::runtime_error("Missing or invalid parameter: " + name) {}
};

std::string string_param(const json& params, const char* name) {
    if (!params.is_object() || !params.contains(name) || !params[name].is_string()) {
        throw ParamError(name);
    }
    return params[name].get<std::string>();
}

std::string optional_string_param(const json& params, const char* name) {
    if (!params.is_object() || !params.contains(name) || params[name].is_null()) return {};
    if (!params[name].is_string()) throw ParamError(name);
    return params[name].get<std::string>();
}

std::optional<int> optional_int_param(const json& params, const char* name) {
    if (!params.is_object() || !params.contains(name) || params[name].is_null()) {
        return std::nullopt;
    }
    if (!params[name].is_number_integer()) throw ParamError(name);
    return params[name].get<int>();
}

// Turns a failed session call into a thrown error so dispatch can stay flat.
template <typename T>
T unwrap(std::expected<T, std::string> r) {
    if (!r) throw std::runtime_error(r.error());
    return std::move(*r);
}

void unwrap(std::expected<void, std::string> r) {
    if (!r) throw std::runtime_error(r.error());
}

} // namespace

DaemonCore::DaemonCore(Session& session, std::string token, LogSink& sink)
    : session_(session), token_(std::move(token)), log_(sink, "Daemon") {}

std::optional<json> DaemonCore::accept(const std::string& line, json& request) {
    try {
        request = json::parse(line);
    } catch (const json::exception&) {
        return rpc::make_error("?", "Invalid JSON");
    }
    if (!request.is_object()) {
        return rpc::make_error("?", "Invalid request");
    }

    json id = request.contains("id") ? request["id"] : json("?");

    const json* token = request.contains("token") ? &request["token"] : nullptr;
    if (!token || !token->is_string() ||
        !rpc::constant_time_equals(token->get_ref<const std::string&>(), token_)) {
        log_.warn("Rejected request with a bad token");
        return rpc::make_error(id, "Unauthorized");
    }

    std::string name = request.contains("method") && request["method"].is_string()
                           ? request["method"].get<std::string>()
                           : std::string();
    auto method = rpc::method_from_string(name);
    if (!method) {
        return rpc::make_error(id, "Unknown RPC method: " + name);
    }

    log_.debug(std::format("RPC {} (id {})", name, id.dump()));

    if (rpc::touches_session(*method)) return std::nullopt;

    switch (*method) {
        case rpc::Method::Ping:
            return rpc::make_result(id, "pong");
        case rpc::Method::GetStatus:
            return rpc::make_result(id, std::string(to_string(session_.status())));
        case rpc::Method::Stop:
            log_.info("Stop requested over RPC");
            stop_requested_.store(true, std::memory_order_release);
            return rpc::make_result(id, "stopping");
        default:
            return rpc::make_error(id, "Unknown RPC method: " + name);
    }
}

json DaemonCore::execute(const json& request) {
    json id = request.contains("id") ? request["id"] : json("?");
    try {
        auto method = rpc::method_from_string(request.at("method").get<std::string>());
        if (!method) return rpc::make_error(id, "Unknown RPC method");
        json params = request.contains("params") ? request["params"] : json::object();
        return rpc::make_result(id, dispatch(*method, params));
    } catch (const std::exception& e) {
        log_.debug(std::format("RPC id {} failed: {}", id.dump(), e.what()));
        return rpc::make_error(id, e.what());
    }
}

json DaemonCore::dispatch(rpc::Method method, const json& params) {
    switch (method) {
        case rpc::Method::GetThreads:
            return unwrap(session_.get_threads());
        case rpc::Method::SearchThreads:
            return unwrap(session_.search_threads(optional_string_param(params, "query")));
        case rpc::Method::FindChatByName: {
            auto found = unwrap(session_.find_chat_by_name(string_param(params, "name")));
            return found ? json(*found) : json(nullptr);
        }
        case rpc::Method::GetMessages: {
            auto chat_id = string_param(params, "chatId");
            return unwrap(session_.get_messages(chat_id, optional_int_param(params, "limit")));
        }
        case rpc::Method::SendMessage: {
            auto chat_id = string_param(params, "chatId");
            unwrap(session_.send_message(chat_id, string_param(params, "text")));
            return nullptr;
        }
        case rpc::Method::SendFile: {
            auto chat_id = string_param(params, "chatId");
            auto path = string_param(params, "filePath");
            unwrap(session_.send_file(chat_id, path, optional_string_param(params, "caption")));
            return nullptr;
        }
        case rpc::Method::ReplyToMessage: {
            auto message_id = string_param(params, "messageId");
            unwrap(session_.reply_to_message(message_id, string_param(params, "text")));
            return nullptr;
        }
        default:
            break;
    }
    throw std::runtime_error(std::format("Unknown RPC method: {}", rpc::to_string(method)));
}

void DaemonCore::shutdown() {
    if (shut_down_.exchange(true)) return;
    log_.info("Destroying session");
    session_.destroy();
}
