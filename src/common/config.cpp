#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::data_dir() const {
    if (!advanced.data_dir.empty()) return advanced.data_dir;
    auto dir = platform::data_dir();
    return dir.empty() ? "/tmp/whatsapp-cli" : dir;
}

std::string Config::auth_dir() const {
    if (!advanced.auth_dir.empty()) return advanced.auth_dir;
    return data_dir() + "/auth";
}

std::string Config::logs_dir() const {
    if (!advanced.logs_dir.empty()) return advanced.logs_dir;
    return data_dir() + "/logs";
}

std::string Config::daemon_executable() const {
    if (!daemon.executable.empty()) return daemon.executable;
    auto dir = platform::executable_dir();
    return (dir.empty() ? std::string(".") : dir) + "/wa-daemon";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("advanced")) {
            auto& a = j["advanced"];
            if (a.contains("debug")) cfg.advanced.debug = a["debug"].get<bool>();
            if (a.contains("data_dir")) cfg.advanced.data_dir = a["data_dir"].get<std::string>();
            if (a.contains("auth_dir")) cfg.advanced.auth_dir = a["auth_dir"].get<std::string>();
            if (a.contains("logs_dir")) cfg.advanced.logs_dir = a["logs_dir"].get<std::string>();
            if (a.contains("browser_path")) cfg.advanced.browser_path = a["browser_path"].get<std::string>();
        }

        if (j.contains("bridge")) {
            auto& b = j["bridge"];
            if (b.contains("command")) cfg.bridge.command = b["command"].get<std::vector<std::string>>();
        }

        if (j.contains("daemon")) {
            auto& d = j["daemon"];
            if (d.contains("executable")) cfg.daemon.executable = d["executable"].get<std::string>();
            if (d.contains("boot_timeout_s")) cfg.daemon.boot_timeout_s = d["boot_timeout_s"].get<uint32_t>();
            if (d.contains("start_timeout_s")) cfg.daemon.start_timeout_s = d["start_timeout_s"].get<uint32_t>();
            if (d.contains("start_poll_ms")) cfg.daemon.start_poll_ms = d["start_poll_ms"].get<uint32_t>();
            if (d.contains("probe_timeout_ms")) cfg.daemon.probe_timeout_ms = d["probe_timeout_ms"].get<uint32_t>();
            if (d.contains("call_timeout_ms")) cfg.daemon.call_timeout_ms = d["call_timeout_ms"].get<uint32_t>();
            if (d.contains("long_call_timeout_ms")) cfg.daemon.long_call_timeout_ms = d["long_call_timeout_ms"].get<uint32_t>();
            if (d.contains("stop_wait_ms")) cfg.daemon.stop_wait_ms = d["stop_wait_ms"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
