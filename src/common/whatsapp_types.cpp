#include "whatsapp_types.hpp"

using json = nlohmann::json;

namespace {

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

// Revives a timestamp: ISO-8601 strings and epoch milliseconds are accepted.
std::optional<iso8601::TimePoint> read_time(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    auto& v = j[key];
    if (v.is_string()) return iso8601::parse(v.get<std::string>());
    if (v.is_number()) {
        return iso8601::TimePoint(std::chrono::milliseconds(v.get<int64_t>()));
    }
    return std::nullopt;
}

} // namespace

void to_json(json& j, const Participant& p) {
    j = {{"id", p.id}, {"name", p.name}};
    if (p.is_admin) j["isAdmin"] = *p.is_admin;
}

void from_json(const json& j, Participant& p) {
    p.id = j.value("id", "");
    p.name = j.value("name", "");
    read_optional(j, "isAdmin", p.is_admin);
}

void to_json(json& j, const Location& l) {
    j = {{"latitude", l.latitude}, {"longitude", l.longitude}};
    if (l.description) j["description"] = *l.description;
}

void from_json(const json& j, Location& l) {
    l.latitude = j.value("latitude", 0.0);
    l.longitude = j.value("longitude", 0.0);
    read_optional(j, "description", l.description);
}

void to_json(json& j, const Message& m) {
    j = {
        {"id", m.id},
        {"type", m.type},
        {"timestamp", iso8601::format(m.timestamp)},
        {"fromMe", m.from_me},
        {"from", m.from},
        {"to", m.to},
        {"threadId", m.thread_id},
        {"body", m.body},
    };
    if (m.sender_name) j["senderName"] = *m.sender_name;
    if (m.ack) j["ack"] = *m.ack;
    if (m.has_media) j["hasMedia"] = true;
    if (m.mimetype) j["mimetype"] = *m.mimetype;
    if (m.filename) j["filename"] = *m.filename;
    if (m.location) j["location"] = *m.location;
}

void from_json(const json& j, Message& m) {
    m.id = j.value("id", "");
    m.type = j.value("type", "unknown");
    m.timestamp = read_time(j, "timestamp").value_or(iso8601::TimePoint{});
    m.from_me = j.value("fromMe", false);
    m.from = j.value("from", "");
    m.to = j.value("to", "");
    m.thread_id = j.value("threadId", "");
    m.body = j.value("body", "");
    read_optional(j, "senderName", m.sender_name);
    read_optional(j, "ack", m.ack);
    m.has_media = j.value("hasMedia", false);
    read_optional(j, "mimetype", m.mimetype);
    read_optional(j, "filename", m.filename);
    read_optional(j, "location", m.location);
}

void to_json(json& j, const Thread& t) {
    j = {
        {"id", t.id},
        {"name", t.name},
        {"isGroup", t.is_group},
        {"unreadCount", t.unread_count},
    };
    if (t.last_message) j["lastMessage"] = *t.last_message;
    if (t.timestamp) j["timestamp"] = iso8601::format(*t.timestamp);
    if (t.participants) j["participants"] = *t.participants;
}

void from_json(const json& j, Thread& t) {
    t.id = j.value("id", "");
    t.name = j.value("name", "");
    t.is_group = j.value("isGroup", false);
    t.unread_count = j.value("unreadCount", 0);
    read_optional(j, "lastMessage", t.last_message);
    t.timestamp = read_time(j, "timestamp");
    read_optional(j, "participants", t.participants);
}

void to_json(json& j, const SearchResult& r) {
    j = {{"thread", r.thread}, {"score", r.score}};
}

void from_json(const json& j, SearchResult& r) {
    r.thread = j.at("thread").get<Thread>();
    r.score = j.value("score", 1.0);
}

std::string message_preview(const Message& m) {
    std::string text;
    if (m.type == "chat" || m.type == "revoked" || m.type == "unknown") {
        text = m.body;
    } else if (m.type == "location") {
        text = "[location]";
        if (m.location && m.location->description) text += " " + *m.location->description;
    } else {
        text = "[" + m.type + "]";
        if (m.filename) text += " " + *m.filename;
        if (!m.body.empty()) text += " " + m.body;
    }

    for (auto& c : text) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return text;
}
