#pragma once

#include "daemon_core.hpp"
#include "daemon_proxy.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "state_store.hpp"
#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <thread>

inline const std::string TEST_TOKEN(64, 'a');

// A daemon serving a FakeSession on a background thread, with its descriptor
// published under a temp directory.
struct TestDaemon {
    TmpDir dir;
    LogSink sink;
    FakeSession session;
    DaemonCore core{session, TEST_TOKEN, sink};
    LinuxEventLoop loop{core, sink};
    StateStore store{dir.file("daemon.json")};
    std::jthread thread;

    TestDaemon() {
        REQUIRE(loop.init());
        REQUIRE(loop.publish(store, TEST_TOKEN).has_value());
        thread = std::jthread([this] { loop.run(); });
    }

    ~TestDaemon() { stop(); }

    uint16_t port() const { return loop.port(); }

    nlohmann::json request(const std::string& id, const std::string& method,
                           nlohmann::json params = nullptr,
                           const std::string& token = TEST_TOKEN) const {
        nlohmann::json req = {{"id", id}, {"method", method}, {"token", token}};
        if (!params.is_null()) req["params"] = std::move(params);
        return req;
    }

    // Sends stop (if still serving) and waits for run() to return.
    void stop() {
        if (!thread.joinable()) return;
        if (!core.stop_requested()) {
            RawConnection conn(port());
            conn.send_json(request("fixture-stop", "stop"));
            conn.read_json();
        }
        thread.join();
    }
};
