#pragma once

namespace kmcp {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if stderr is a terminal.
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Colored log output is used only on an interactive stderr without NO_COLOR.
bool ShouldColorStderr();

} // namespace kmcp
