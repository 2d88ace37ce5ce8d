#include "platform/linux/linux_event_loop.hpp"

#include "iso8601.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

LinuxEventLoop::LinuxEventLoop(DaemonCore& core, LogSink& sink)
    : core_(core), log_(sink, "EventLoop") {}

LinuxEventLoop::~LinuxEventLoop() {
    workers_.clear();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    if (!ipc_server_.start("127.0.0.1", 0)) return false;
    log_.info(std::format("Daemon listening on 127.0.0.1:{}", ipc_server_.port()));

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        log_.error(std::format("epoll_create1 failed: {}", std::strerror(errno)));
        return false;
    }

    // The signals are blocked by main() before any thread exists; here they
    // only get a descriptor.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        log_.error(std::format("signalfd failed: {}", std::strerror(errno)));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        log_.error(std::format("eventfd failed: {}", std::strerror(errno)));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        log_.error(std::format("epoll_ctl failed: {}", std::strerror(errno)));
        return false;
    }
    return true;
}

std::expected<void, std::string> LinuxEventLoop::publish(StateStore& store,
                                                         const std::string& token) {
    DaemonDescriptor desc{
        .pid = static_cast<int>(::getpid()),
        .port = ipc_server_.port(),
        .started_at = iso8601::format(std::chrono::system_clock::now()),
        .token = token,
    };
    auto written = store.write(desc);
    if (!written) return written;
    published_ = &store;
    log_.debug("Wrote " + store.path());
    return {};
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (!signalled_ && !core_.stop_requested()) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_.error(std::format("epoll_wait error: {}", std::strerror(errno)));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                    log_.info(std::format("Received signal {}, shutting down", info.ssi_signo));
                    signalled_ = true;
                }
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                while (true) {
                    int client_fd = ipc_server_.accept_client();
                    if (client_fd < 0) break;
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                while (::read(worker_event_fd_, &val, sizeof(val)) > 0) {}
                on_jobs_complete();
                continue;
            }

            // Client fd
            if (events[i].events & EPOLLOUT) on_client_writable(fd);
            if (events[i].events & (EPOLLIN | EPOLLHUP | EPOLLERR)) on_client_readable(fd);
        }
    }

    shutdown();
}

void LinuxEventLoop::on_client_readable(int fd) {
    auto conn = ipc_server_.conn_id(fd);
    if (!conn) return;

    std::vector<std::string> lines;
    bool alive = ipc_server_.read_lines(fd, lines);

    for (auto& line : lines) {
        nlohmann::json request;
        if (auto response = core_.accept(line, request)) {
            send(fd, *response);
        } else {
            start_job(*conn, std::move(request));
        }
    }

    if (!alive) drop_client(fd);
}

void LinuxEventLoop::on_client_writable(int fd) {
    if (!ipc_server_.flush(fd)) {
        drop_client(fd);
        return;
    }
    update_interest(fd);
}

void LinuxEventLoop::start_job(IpcServer::ConnId conn, nlohmann::json request) {
    uint64_t job = ++next_job_;
    workers_.emplace(job, std::jthread([this, job, conn, request = std::move(request)] {
        auto response = core_.execute(request);
        {
            std::lock_guard lock(done_mutex_);
            done_.push_back({.job = job, .conn = conn, .response = std::move(response)});
        }
        uint64_t val = 1;
        ssize_t ignored = ::write(worker_event_fd_, &val, sizeof(val));
        (void)ignored;
    }));
}

void LinuxEventLoop::on_jobs_complete() {
    std::deque<Completion> done;
    {
        std::lock_guard lock(done_mutex_);
        done.swap(done_);
    }

    for (auto& c : done) {
        workers_.erase(c.job); // joins; the worker is past its last statement
        int fd = ipc_server_.fd_for(c.conn);
        if (fd < 0) {
            log_.debug(std::format("Dropping response for closed connection {}", c.conn));
            continue;
        }
        send(fd, c.response);
    }
}

void LinuxEventLoop::send(int fd, const nlohmann::json& response) {
    if (!ipc_server_.send_response(fd, response)) {
        drop_client(fd);
        return;
    }
    update_interest(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    if (!ipc_server_.conn_id(fd)) return;
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::update_interest(int fd) {
    uint32_t events = EPOLLIN;
    if (ipc_server_.has_pending_output(fd)) events |= EPOLLOUT;
    epoll_event ev{.events = events, .data = {.fd = fd}};
    epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
}

void LinuxEventLoop::shutdown() {
    log_.info("Shutting down");

    if (ipc_server_.server_fd() >= 0) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, ipc_server_.server_fd(), nullptr);
        ipc_server_.close_listener();
    }

    core_.shutdown();

    workers_.clear();
    on_jobs_complete();
    ipc_server_.flush_all(std::chrono::seconds(2));
    ipc_server_.stop();

    if (published_) {
        published_->remove();
        published_ = nullptr;
    }
    log_.info("Daemon stopped");
}
