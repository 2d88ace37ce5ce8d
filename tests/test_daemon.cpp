#include <catch2/catch.hpp>

#include "daemon_fixture.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Runs a request line through the same accept/execute path the loop uses.
json handle(DaemonCore& core, const std::string& line) {
    json request;
    if (auto direct = core.accept(line, request)) return *direct;
    return core.execute(request);
}

}  // namespace

TEST_CASE("DaemonCore dispatch", "[daemon]") {
    LogSink sink;
    FakeSession session;
    DaemonCore core(session, TEST_TOKEN, sink);

    auto req = [](json id, const std::string& method, json params = nullptr,
                  const std::string& token = TEST_TOKEN) {
        json r = {{"id", std::move(id)}, {"method", method}, {"token", token}};
        if (!params.is_null()) r["params"] = std::move(params);
        return r.dump();
    };

    SECTION("PingAnswersPong") {
        auto resp = handle(core, req("1", "ping"));
        REQUIRE(resp == json{{"id", "1"}, {"result", "pong"}});
    }

    SECTION("IdEchoedVerbatim") {
        REQUIRE(handle(core, req(7, "ping"))["id"] == 7);
        REQUIRE(handle(core, req(json::object({{"k", 1}}), "ping"))["id"] == json{{"k", 1}});
    }

    SECTION("InvalidJson") {
        auto resp = handle(core, "{not json");
        REQUIRE(resp == json{{"id", "?"}, {"error", "Invalid JSON"}});
    }

    SECTION("NonObjectIsInvalidRequest") {
        REQUIRE(handle(core, "[1,2,3]")["error"] == "Invalid request");
        REQUIRE(handle(core, "42")["id"] == "?");
    }

    SECTION("WrongTokenUnauthorized") {
        auto resp = handle(core, req("x", "ping", nullptr, std::string(64, 'b')));
        REQUIRE(resp == json{{"id", "x"}, {"error", "Unauthorized"}});
    }

    SECTION("MissingOrShortTokenUnauthorized") {
        REQUIRE(handle(core, R"({"id":"1","method":"ping"})")["error"] == "Unauthorized");
        REQUIRE(handle(core, R"({"id":"1","method":"ping","token":42})")["error"] == "Unauthorized");
        REQUIRE(handle(core, req("1", "ping", nullptr, TEST_TOKEN.substr(0, 63)))["error"] ==
                "Unauthorized");
        REQUIRE(handle(core, req("1", "ping", nullptr, TEST_TOKEN + "a"))["error"] ==
                "Unauthorized");
    }

    SECTION("AuthenticationComesBeforeMethodCheck") {
        auto resp = handle(core, req("1", "bogus", nullptr, "nope"));
        REQUIRE(resp["error"] == "Unauthorized");
    }

    SECTION("UnknownMethod") {
        auto resp = handle(core, req("1", "bogus"));
        REQUIRE(resp == json{{"id", "1"}, {"error", "Unknown RPC method: bogus"}});
    }

    SECTION("GetStatusReportsSessionStatus") {
        session.status_value = SessionStatus::Authenticated;
        REQUIRE(handle(core, req("1", "getStatus"))["result"] == "authenticated");
    }

    SECTION("GetThreadsSerializesTimestamps") {
        auto resp = handle(core, req("1", "getThreads"));
        REQUIRE(resp["result"].size() == 2);
        REQUIRE(resp["result"][0]["name"] == "Alice");
        REQUIRE(resp["result"][0]["timestamp"] == "2024-05-01T09:30:00.250Z");
        REQUIRE(resp["result"][0]["lastMessage"]["body"] == "hi there");
        REQUIRE(resp["result"][1]["isGroup"] == true);
    }

    SECTION("SearchThreadsDefaultsQuery") {
        auto resp = handle(core, req("1", "searchThreads"));
        REQUIRE(resp.contains("result"));
        REQUIRE(session.last_query.empty());
        REQUIRE(handle(core, req("2", "searchThreads", {{"query", "Rocket"}}))["result"].size() == 1);
    }

    SECTION("FindChatByNameNullWhenAbsent") {
        auto resp = handle(core, req("1", "findChatByName", {{"name", "Nobody"}}));
        REQUIRE(resp.contains("result"));
        REQUIRE(resp["result"].is_null());
        auto found = handle(core, req("2", "findChatByName", {{"name", "Alice"}}));
        REQUIRE(found["result"]["id"] == "1@c.us");
    }

    SECTION("GetMessagesPassesLimit") {
        auto resp = handle(core, req("1", "getMessages", {{"chatId", "1@c.us"}, {"limit", 5}}));
        REQUIRE(resp["result"].size() == 2);
        REQUIRE(session.last_limit == 5);

        handle(core, req("2", "getMessages", {{"chatId", "1@c.us"}}));
        REQUIRE_FALSE(session.last_limit.has_value());
    }

    SECTION("SessionErrorsAreVerbatim") {
        auto resp = handle(core, req("1", "getMessages", {{"chatId", "nobody"}}));
        REQUIRE(resp == json{{"id", "1"}, {"error", "Chat not found: nobody"}});
        auto send = handle(core, req("2", "sendMessage", {{"chatId", "fail@c.us"}, {"text", "x"}}));
        REQUIRE(send["error"] == "Evaluation failed: send refused");
    }

    SECTION("SendsReturnNull") {
        auto r1 = handle(core, req("1", "sendMessage", {{"chatId", "1@c.us"}, {"text", "hello"}}));
        auto r2 = handle(core, req("2", "sendFile", {{"chatId", "1@c.us"}, {"filePath", "/tmp/a.png"}}));
        auto r3 = handle(core, req("3", "replyToMessage", {{"messageId", "m1"}, {"text", "ok"}}));
        REQUIRE(r1 == json{{"id", "1"}, {"result", nullptr}});
        REQUIRE(r2["result"].is_null());
        REQUIRE(r3["result"].is_null());
        REQUIRE(session.side_effects() == std::vector<std::string>{
                    "send:1@c.us:hello", "file:1@c.us:/tmp/a.png:", "reply:m1:ok"});
    }

    SECTION("MissingParametersAreErrors") {
        auto resp = handle(core, req("1", "sendMessage", {{"chatId", "1@c.us"}}));
        REQUIRE(resp["error"] == "Missing or invalid parameter: text");
        REQUIRE(handle(core, req("2", "findChatByName"))["error"] ==
                "Missing or invalid parameter: name");
        REQUIRE(handle(core, req("3", "getMessages", {{"chatId", "1@c.us"}, {"limit", "ten"}}))["error"] ==
                "Missing or invalid parameter: limit");
        REQUIRE(session.side_effects().empty());
    }

    SECTION("StopRepliesStopping") {
        REQUIRE_FALSE(core.stop_requested());
        auto resp = handle(core, req("s", "stop"));
        REQUIRE(resp == json{{"id", "s"}, {"result", "stopping"}});
        REQUIRE(core.stop_requested());
    }

    SECTION("UnauthorizedCallsHaveNoSideEffects") {
        for (auto method : {"ping", "getStatus", "getThreads", "searchThreads", "findChatByName",
                            "getMessages", "sendMessage", "sendFile", "replyToMessage", "stop"}) {
            auto resp = handle(core, req("1", method,
                                        {{"chatId", "1@c.us"}, {"text", "x"}, {"name", "Alice"},
                                         {"filePath", "/tmp/x"}, {"messageId", "m1"}},
                                        "wrong"));
            REQUIRE(resp["error"] == "Unauthorized");
        }
        REQUIRE(session.session_calls.load() == 0);
        REQUIRE(session.side_effects().empty());
        REQUIRE_FALSE(core.stop_requested());
    }
}

TEST_CASE("Daemon over TCP", "[daemon]") {
    TestDaemon daemon;

    SECTION("DescriptorPublished") {
        auto desc = daemon.store.read();
        REQUIRE(desc.has_value());
        REQUIRE(desc->port == daemon.port());
        REQUIRE(desc->token == TEST_TOKEN);
        REQUIRE(desc->pid == ::getpid());
        REQUIRE(iso8601::parse(desc->started_at).has_value());
    }

    SECTION("PingRoundTrip") {
        RawConnection conn(daemon.port());
        REQUIRE(conn.connected());
        REQUIRE(conn.send_json(daemon.request("1", "ping")));
        REQUIRE(conn.read_json().value() == json{{"id", "1"}, {"result", "pong"}});
    }

    SECTION("InvalidJsonKeepsConnectionOpen") {
        RawConnection conn(daemon.port());
        REQUIRE(conn.send_raw("this is not json\n"));
        REQUIRE(conn.read_json().value() == json{{"id", "?"}, {"error", "Invalid JSON"}});
        REQUIRE(conn.send_json(daemon.request("2", "ping")));
        REQUIRE(conn.read_json().value() == json{{"id", "2"}, {"result", "pong"}});
    }

    SECTION("UnauthorizedAndUnknownMethod") {
        RawConnection conn(daemon.port());
        conn.send_json(daemon.request("1", "ping", nullptr, "deadbeef"));
        REQUIRE(conn.read_json().value() == json{{"id", "1"}, {"error", "Unauthorized"}});
        conn.send_json(daemon.request("2", "bogus"));
        REQUIRE(conn.read_json().value() == json{{"id", "2"}, {"error", "Unknown RPC method: bogus"}});
    }

    SECTION("UnauthorizedStopDoesNotStop") {
        RawConnection conn(daemon.port());
        conn.send_json(daemon.request("1", "stop", nullptr, "wrong"));
        REQUIRE(conn.read_json().value()["error"] == "Unauthorized");
        conn.send_json(daemon.request("2", "ping"));
        REQUIRE(conn.read_json().value()["result"] == "pong");
        REQUIRE(std::filesystem::exists(daemon.store.path()));
    }

    SECTION("OversizedLineDropsConnection") {
        RawConnection conn(daemon.port());
        // The daemon may reset the connection before everything is written.
        (void)conn.send_raw(std::string(rpc::MAX_LINE_BYTES + 8192, 'x'));

        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(conn.read_json().has_value());
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));

        RawConnection next(daemon.port());
        REQUIRE(next.send_json(daemon.request("1", "ping")));
        REQUIRE(next.read_json().value() == json{{"id", "1"}, {"result", "pong"}});
    }

    SECTION("PipelinedRequestsInArbitraryChunks") {
        constexpr int N = 40;
        std::string wire;
        std::set<std::string> expected_ids;
        for (int i = 0; i < N; i++) {
            auto id = "p" + std::to_string(i);
            expected_ids.insert(id);
            wire += rpc::encode(daemon.request(id, i % 3 == 0 ? "getThreads" : "ping"));
        }

        RawConnection conn(daemon.port());
        size_t chunk = 1;
        for (size_t pos = 0; pos < wire.size(); pos += chunk, chunk = chunk % 37 + 3) {
            REQUIRE(conn.send_raw(wire.substr(pos, chunk)));
        }

        std::set<std::string> seen;
        for (int i = 0; i < N; i++) {
            auto resp = conn.read_json();
            REQUIRE(resp.has_value());
            REQUIRE(resp->contains("result"));
            seen.insert((*resp)["id"].get<std::string>());
        }
        REQUIRE(seen == expected_ids);
    }

    SECTION("SlowCallDoesNotBlockOthers") {
        daemon.session.threads_delay = std::chrono::milliseconds(500);
        RawConnection conn(daemon.port());
        conn.send_json(daemon.request("slow", "getThreads"));
        conn.send_json(daemon.request("fast", "ping"));

        auto first = conn.read_json();
        auto second = conn.read_json();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE((*first)["id"] == "fast");
        REQUIRE((*second)["id"] == "slow");
        REQUIRE((*second)["result"].size() == 2);
    }

    SECTION("ClientGoneBeforeResponse") {
        daemon.session.threads_delay = std::chrono::milliseconds(200);
        {
            RawConnection conn(daemon.port());
            conn.send_json(daemon.request("1", "getThreads"));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(400));

        RawConnection conn(daemon.port());
        conn.send_json(daemon.request("2", "ping"));
        REQUIRE(conn.read_json().value() == json{{"id", "2"}, {"result", "pong"}});
    }

    SECTION("ConcurrentConnections") {
        std::vector<std::jthread> clients;
        std::atomic<int> ok{0};
        for (int i = 0; i < 8; i++) {
            clients.emplace_back([&daemon, &ok, i] {
                RawConnection conn(daemon.port());
                auto id = "c" + std::to_string(i);
                conn.send_json(daemon.request(id, "getStatus"));
                auto resp = conn.read_json();
                if (resp && (*resp)["id"] == id && (*resp)["result"] == "ready") ok++;
            });
        }
        clients.clear();
        REQUIRE(ok.load() == 8);
    }

    SECTION("StopRemovesDescriptorAndClosesListener") {
        uint16_t port = daemon.port();
        RawConnection conn(port);
        conn.send_json(daemon.request("bye", "stop"));
        REQUIRE(conn.read_json().value() == json{{"id", "bye"}, {"result", "stopping"}});

        daemon.thread.join();
        REQUIRE(conn.at_eof());
        REQUIRE_FALSE(std::filesystem::exists(daemon.store.path()));
        REQUIRE(daemon.session.destroy_calls.load() == 1);

        RawConnection late(port);
        REQUIRE_FALSE(late.connected());
    }

    SECTION("StopFailsInFlightCalls") {
        daemon.session.threads_delay = std::chrono::seconds(30);
        RawConnection slow(daemon.port());
        slow.send_json(daemon.request("pending", "getThreads"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        RawConnection conn(daemon.port());
        conn.send_json(daemon.request("bye", "stop"));
        REQUIRE(conn.read_json().value()["result"] == "stopping");

        auto resp = slow.read_json();
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["id"] == "pending");
        REQUIRE((*resp)["error"] == "Session destroyed");
        daemon.thread.join();
    }
}
