#include <kmcp/core/shutdown.hpp>

#include <csignal>

#include <signal.h>
#include <unistd.h>

namespace kmcp {

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_close_stdin = 0;

void OnShutdownSignal(int /*signal_number*/) {
    g_shutdown_requested = 1;
    if (g_close_stdin != 0) {
        ::close(STDIN_FILENO);
    }
}

} // anonymous namespace

void InstallShutdownHandlers(bool close_stdin) {
    g_close_stdin = close_stdin ? 1 : 0;

    struct sigaction action {};
    action.sa_handler = OnShutdownSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

bool ShutdownRequested() noexcept {
    return g_shutdown_requested != 0;
}

void RequestShutdown() noexcept {
    g_shutdown_requested = 1;
}

void ResetShutdownFlag() noexcept {
    g_shutdown_requested = 0;
}

} // namespace kmcp
