#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Advanced {
        bool debug = false;
        // Empty directories resolve to the platform defaults.
        std::string data_dir;
        std::string auth_dir;
        std::string logs_dir;
        std::string browser_path;
    } advanced;

    struct Bridge {
        std::vector<std::string> command = {"whatsapp-bridge"};
    } bridge;

    struct Daemon {
        std::string executable; // defaults to wa-daemon next to the wa binary
        uint32_t boot_timeout_s = 90;
        uint32_t start_timeout_s = 95;
        uint32_t start_poll_ms = 600;
        uint32_t probe_timeout_ms = 1500;
        uint32_t call_timeout_ms = 30000;
        uint32_t long_call_timeout_ms = 60000;
        uint32_t stop_wait_ms = 12000;
    } daemon;

    std::string data_dir() const;
    std::string auth_dir() const;
    std::string logs_dir() const;

    std::string state_file() const { return data_dir() + "/daemon.json"; }
    std::string lock_file() const { return data_dir() + "/daemon.lock"; }
    std::string log_file() const { return logs_dir() + "/whatsapp-cli.log"; }
    std::string daemon_executable() const;

    static Config load(const std::string& path);
    static Config load_default();
};
