#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    setsid();

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    freopen("/dev/null", "r", stdin);
    freopen("/dev/null", "w", stdout);
    freopen("/dev/null", "w", stderr);
}

bool spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) ::_exit(grandchild < 0 ? 1 : 0);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        ::execv(args[0], args.data());
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

sigset_t block_termination_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    return mask;
}

int wait_termination_signal(std::chrono::milliseconds timeout) {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    timespec ts{.tv_sec = static_cast<time_t>(secs.count()),
                .tv_nsec = static_cast<long>(
                    std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs).count())};
    while (true) {
        int sig = ::sigtimedwait(&mask, nullptr, &ts);
        if (sig > 0) return sig;
        if (errno == EINTR) continue;
        return 0;
    }
}

} // namespace platform
