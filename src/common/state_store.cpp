#include "state_store.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

std::expected<void, std::string> StateStore::write(const DaemonDescriptor& desc) const {
    std::error_code ec;
    auto dir = fs::path(path_).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            return std::unexpected("cannot create " + dir.string() + ": " + ec.message());
        }
    }

    json j = {
        {"pid", desc.pid},
        {"port", desc.port},
        {"startedAt", desc.started_at},
        {"token", desc.token},
    };
    std::string content = j.dump();

    std::string tmpl = path_ + ".XXXXXX";
    int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected("cannot create temp file for " + path_ + ": " + std::strerror(errno));
    }
    // mkostemp already uses 0600; be explicit against odd umasks.
    ::fchmod(fd, S_IRUSR | S_IWUSR);

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            ::close(fd);
            ::unlink(tmpl.c_str());
            return std::unexpected("write to " + tmpl + " failed: " + err);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) < 0 || ::close(fd) < 0) {
        std::string err = std::strerror(errno);
        ::unlink(tmpl.c_str());
        return std::unexpected("flushing " + tmpl + " failed: " + err);
    }

    if (::rename(tmpl.c_str(), path_.c_str()) < 0) {
        std::string err = std::strerror(errno);
        ::unlink(tmpl.c_str());
        return std::unexpected("rename to " + path_ + " failed: " + err);
    }

    return {};
}

std::optional<DaemonDescriptor> StateStore::read() const {
    std::ifstream f(path_);
    if (!f.is_open()) return std::nullopt;

    try {
        auto j = json::parse(f);
        if (!j.is_object()) return std::nullopt;

        DaemonDescriptor desc;
        desc.pid = j.at("pid").get<int>();
        int port = j.at("port").get<int>();
        desc.started_at = j.value("startedAt", "");
        desc.token = j.at("token").get<std::string>();

        if (port <= 0 || port > 65535 || desc.token.empty()) return std::nullopt;
        desc.port = static_cast<uint16_t>(port);
        return desc;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

void StateStore::remove() const {
    ::unlink(path_.c_str());
}

InstanceLock::~InstanceLock() {
    release();
}

std::expected<void, std::string> InstanceLock::acquire(const std::string& path) {
    release();

    std::error_code ec;
    auto dir = fs::path(path).parent_path();
    if (!dir.empty()) fs::create_directories(dir, ec);

    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return std::unexpected("another daemon instance is already running");
        }
        return std::unexpected("flock(" + path + ") failed: " + std::strerror(err));
    }

    fd_ = fd;
    return {};
}

void InstanceLock::release() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
