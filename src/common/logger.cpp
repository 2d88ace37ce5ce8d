#include "logger.hpp"

#include "iso8601.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

LogSink::~LogSink() {
    close();
}

bool LogSink::open(const std::string& path) {
    std::lock_guard lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    file_ = std::fopen(path.c_str(), "ae");
    return file_ != nullptr;
}

void LogSink::close() {
    std::lock_guard lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void LogSink::write(std::string_view level, std::string_view context, std::string_view msg) {
    auto now = iso8601::format(std::chrono::system_clock::now());

    std::lock_guard lock(mutex_);
    if (file_) {
        std::println(file_, "[{}] [{}] [{}] {}", now, level, context, msg);
        std::fflush(file_);
    }
    if (mirror_stderr_) {
        std::println(stderr, "[whatsapp-cli] [{}] {}", context, msg);
    }
}
