#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "session.hpp"

#include <string>

// Boots `session` and serves it until a stop RPC or SIGINT/SIGTERM. The
// signals must already be blocked in every thread; one arriving during the
// boot wait aborts it. The descriptor at config.state_file() is written only
// once the session is ready and the listener is up, and removed on the way
// out. Returns the process exit code.
int run_daemon(Session& session, const Config& config, const std::string& token, LogSink& sink);
