#include <tool_bridge/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace tool_bridge {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace tool_bridge
