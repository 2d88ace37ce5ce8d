#pragma once

#include "iso8601.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Wire shapes shared by the daemon, the IPC proxy and the session bridge.
// Timestamps travel as ISO-8601 strings and are revived into time points when
// decoded; any other string is kept as is.

struct Participant {
    std::string id;
    std::string name;
    std::optional<bool> is_admin;
};

struct Location {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<std::string> description;
};

struct Message {
    std::string id;
    std::string type = "unknown"; // chat, image, video, audio, document, sticker, location, vcard, revoked, unknown
    iso8601::TimePoint timestamp{};
    bool from_me = false;
    std::string from;
    std::string to;
    std::string thread_id;
    std::string body;
    std::optional<std::string> sender_name;
    std::optional<int> ack; // -1 error, 0 pending, 1 sent, 2 delivered, 3 read
    bool has_media = false;
    std::optional<std::string> mimetype;
    std::optional<std::string> filename;
    std::optional<Location> location;
};

struct Thread {
    std::string id;
    std::string name;
    bool is_group = false;
    int unread_count = 0;
    std::optional<Message> last_message;
    std::optional<iso8601::TimePoint> timestamp;
    std::optional<std::vector<Participant>> participants;
};

struct SearchResult {
    Thread thread;
    double score = 1.0;
};

void to_json(nlohmann::json& j, const Participant& p);
void from_json(const nlohmann::json& j, Participant& p);
void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);
void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);
void to_json(nlohmann::json& j, const Thread& t);
void from_json(const nlohmann::json& j, Thread& t);
void to_json(nlohmann::json& j, const SearchResult& r);
void from_json(const nlohmann::json& j, SearchResult& r);

// Short single-line rendering used by the CLI listings.
std::string message_preview(const Message& m);
