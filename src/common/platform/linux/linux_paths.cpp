#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace platform {

namespace {

constexpr const char* APP_DIR = "whatsapp-cli";

// $<xdg_var>/whatsapp-cli, else $HOME/<home_rel>/whatsapp-cli.
std::string xdg_dir(const char* xdg_var, const char* home_rel) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/" + APP_DIR;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_rel + "/" + APP_DIR;
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return exe.parent_path().string();
}

} // namespace platform
