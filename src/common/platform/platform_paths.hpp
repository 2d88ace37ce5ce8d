#pragma once

#include <string>

namespace platform {

// Per-user directories. Empty when neither the XDG variable nor $HOME is set.
std::string config_dir();
std::string data_dir();

// Directory holding the running executable.
std::string executable_dir();

} // namespace platform
