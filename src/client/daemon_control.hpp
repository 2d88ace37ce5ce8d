#pragma once

#include "config.hpp"
#include "logger.hpp"

#include <string>

// `wa daemon start|stop|status`. Each prints one result and returns the
// process exit code. `config_path` is handed on to the spawned daemon.
int daemon_start(const Config& config, const std::string& config_path, LogSink& sink);
int daemon_stop(const Config& config, LogSink& sink);
int daemon_status(const Config& config, LogSink& sink);
