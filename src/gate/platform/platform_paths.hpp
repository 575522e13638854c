#pragma once

#include <string>

namespace platform {

// Empty when neither the XDG variable nor HOME is set.
std::string config_dir();

// Machine name from uname(2), e.g. "aarch64". Empty on failure.
std::string machine_arch();

} // namespace platform
