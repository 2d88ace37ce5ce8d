#pragma once

#include <chrono>
#include <signal.h>
#include <string>
#include <vector>

namespace platform {

// Classic double fork: the caller continues as a session leader's child with
// stdio on /dev/null. The original parent exits.
void daemonize();

// Starts argv in its own session, detached from the caller. The intermediate
// child is reaped before returning, so no zombie is left behind.
bool spawn_detached(const std::vector<std::string>& argv);

// Blocks SIGINT and SIGTERM in the calling thread. Call before any thread is
// created so every thread inherits the mask and the signals only surface
// through a signalfd.
sigset_t block_termination_signals();

// Waits up to `timeout` for a blocked SIGINT/SIGTERM and consumes it.
// Returns the signal number, or 0 when none arrived.
int wait_termination_signal(std::chrono::milliseconds timeout);

} // namespace platform
