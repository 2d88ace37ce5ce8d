#pragma once

#include "daemon_core.hpp"
#include "logger.hpp"
#include "platform/linux/tcp_socket_server.hpp"
#include "state_store.hpp"

#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

class LinuxEventLoop {
public:
    LinuxEventLoop(DaemonCore& core, LogSink& sink);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Binds 127.0.0.1 on a kernel-chosen port and sets up epoll.
    bool init();
    uint16_t port() const { return ipc_server_.port(); }

    // Writes the descriptor for this listener. run() removes it on the way out.
    std::expected<void, std::string> publish(StateStore& store, const std::string& token);

    // Serves until stop is requested over RPC or SIGINT/SIGTERM arrives,
    // then shuts down: listener, session, workers, pending replies, descriptor.
    void run();

private:
    struct Completion {
        uint64_t job;
        IpcServer::ConnId conn;
        nlohmann::json response;
    };

    void on_client_readable(int fd);
    void on_client_writable(int fd);
    void start_job(IpcServer::ConnId conn, nlohmann::json request);
    void on_jobs_complete();
    void send(int fd, const nlohmann::json& response);
    void drop_client(int fd);
    void update_interest(int fd);
    void shutdown();

    DaemonCore& core_;
    Logger log_;
    TcpSocketServer ipc_server_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    bool signalled_ = false;

    StateStore* published_ = nullptr;

    uint64_t next_job_ = 0;
    std::map<uint64_t, std::jthread> workers_;
    std::mutex done_mutex_;
    std::deque<Completion> done_;
};
