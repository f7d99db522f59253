#include <kmcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace kmcp {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(STDERR_FILENO);
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ShouldColorStderr() {
    return IsStderrTty() && !NoColorEnvSet();
}

} // namespace kmcp
