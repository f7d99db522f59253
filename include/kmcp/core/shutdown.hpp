#pragma once

namespace kmcp {

// ---------------------------------------------------------------------------
// Process shutdown flag driven by SIGINT/SIGTERM.
//
// The handlers are installed without SA_RESTART. iostreams retry reads
// interrupted by a signal, so with close_stdin set the handler also closes
// fd 0 to make a transport blocked on stdin see end of input. SIGPIPE is
// ignored so a vanished peer surfaces as a write error instead of killing
// the process.
// ---------------------------------------------------------------------------
void InstallShutdownHandlers(bool close_stdin = false);

[[nodiscard]] bool ShutdownRequested() noexcept;

/// Set the flag without a signal (tests, fatal transport errors).
void RequestShutdown() noexcept;

/// Clear the flag. Only meaningful in tests.
void ResetShutdownFlag() noexcept;

} // namespace kmcp
