#include <catch2/catch.hpp>

#include "whatsapp_types.hpp"

using json = nlohmann::json;

TEST_CASE("WhatsApp wire types", "[types]") {

    SECTION("MessageEncodesCamelCase") {
        Message m;
        m.id = "true_1@c.us_ABC";
        m.type = "chat";
        m.timestamp = *iso8601::parse("2024-05-01T09:30:00.250Z");
        m.from_me = true;
        m.from = "me@c.us";
        m.to = "1@c.us";
        m.thread_id = "1@c.us";
        m.body = "hi";
        m.ack = 2;

        json j = m;
        REQUIRE(j["timestamp"] == "2024-05-01T09:30:00.250Z");
        REQUIRE(j["fromMe"] == true);
        REQUIRE(j["threadId"] == "1@c.us");
        REQUIRE(j["ack"] == 2);
        REQUIRE_FALSE(j.contains("senderName"));
        REQUIRE_FALSE(j.contains("hasMedia"));
        REQUIRE_FALSE(j.contains("location"));
    }

    SECTION("MessageDecodesTimestampForms") {
        auto iso = json::parse(R"({"id":"a","timestamp":"2024-05-01T11:30:00.250+02:00"})").get<Message>();
        REQUIRE(iso8601::format(iso.timestamp) == "2024-05-01T09:30:00.250Z");

        auto epoch = json::parse(R"({"id":"b","timestamp":1714555800250})").get<Message>();
        REQUIRE(iso8601::format(epoch.timestamp) == "2024-05-01T09:30:00.250Z");

        auto garbage = json::parse(R"({"id":"c","timestamp":"yesterday"})").get<Message>();
        REQUIRE(garbage.timestamp == iso8601::TimePoint{});
    }

    SECTION("MessageDefaultsForMissingFields") {
        auto m = json::parse(R"({"id":"x"})").get<Message>();
        REQUIRE(m.type == "unknown");
        REQUIRE_FALSE(m.from_me);
        REQUIRE(m.body.empty());
        REQUIRE_FALSE(m.ack.has_value());
        REQUIRE_FALSE(m.sender_name.has_value());
    }

    SECTION("MediaAndLocation") {
        auto m = json::parse(R"({
            "id": "m", "type": "location", "hasMedia": false,
            "location": {"latitude": 52.5, "longitude": 13.4, "description": "Berlin"},
            "senderName": null
        })").get<Message>();
        REQUIRE(m.location.has_value());
        REQUIRE(m.location->latitude == 52.5);
        REQUIRE(m.location->description == "Berlin");
        REQUIRE_FALSE(m.sender_name.has_value());
    }

    SECTION("ThreadRoundTripKeepsOptionalFields") {
        Thread t;
        t.id = "2@g.us";
        t.name = "Team Rocket";
        t.is_group = true;
        t.unread_count = 3;
        t.timestamp = iso8601::parse("2024-05-01T09:30:00.250Z");
        t.participants = std::vector<Participant>{{"1@c.us", "Alice", true}, {"3@c.us", "Bob", {}}};

        json j = t;
        REQUIRE(j["isGroup"] == true);
        REQUIRE(j["unreadCount"] == 3);
        REQUIRE(j["participants"][0]["isAdmin"] == true);
        REQUIRE_FALSE(j["participants"][1].contains("isAdmin"));
        REQUIRE_FALSE(j.contains("lastMessage"));

        auto back = j.get<Thread>();
        REQUIRE(back.name == "Team Rocket");
        REQUIRE(back.timestamp == t.timestamp);
        REQUIRE(back.participants->size() == 2);
        REQUIRE(back.participants->at(1).name == "Bob");
    }

    SECTION("ThreadWithoutTimestamp") {
        auto t = json::parse(R"({"id":"1@c.us","name":"Alice"})").get<Thread>();
        REQUIRE_FALSE(t.timestamp.has_value());
        REQUIRE(t.unread_count == 0);
        REQUIRE_FALSE(t.last_message.has_value());
    }

    SECTION("SearchResultRequiresThread") {
        auto r = json::parse(R"({"thread":{"id":"1@c.us","name":"Alice"},"score":0.5})").get<SearchResult>();
        REQUIRE(r.thread.id == "1@c.us");
        REQUIRE(r.score == 0.5);
        REQUIRE_THROWS_AS(json::parse(R"({"score":1})").get<SearchResult>(), json::exception);
    }
}

TEST_CASE("message_preview", "[types]") {
    Message m;

    SECTION("TextIsFlattened") {
        m.type = "chat";
        m.body = "line one\nline two\r\n";
        REQUIRE(message_preview(m) == "line one line two  ");
    }

    SECTION("MediaShowsTypeAndName") {
        m.type = "document";
        m.filename = "report.pdf";
        m.body = "see attached";
        REQUIRE(message_preview(m) == "[document] report.pdf see attached");
    }

    SECTION("BareMedia") {
        m.type = "sticker";
        REQUIRE(message_preview(m) == "[sticker]");
    }

    SECTION("Location") {
        m.type = "location";
        m.location = Location{1.0, 2.0, "Office"};
        REQUIRE(message_preview(m) == "[location] Office");
    }
}
