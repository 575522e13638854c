#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <sys/utsname.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/speechgate";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/speechgate";
}

std::string machine_arch() {
    utsname info{};
    if (uname(&info) != 0) return {};
    return info.machine;
}

} // namespace platform
