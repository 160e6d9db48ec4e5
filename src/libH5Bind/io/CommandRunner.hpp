#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

// ============================================================================
// CommandRunner - synchronous subprocess execution
// ============================================================================
// Used for pkg-config queries and for driving the native HDF5 build.
// Calls block until the child exits; there is no timeout.
// ============================================================================

namespace h5bind {

struct CommandResult {
    /// Child exit status; 127 when the program could not be started,
    /// 128 + signal number when the child was killed by a signal.
    i32 exitStatus = 0;

    /// Captured stdout (Capture only)
    String output;

    bool Succeeded() const { return exitStatus == 0; }
};

class HB_API CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run argv[0] (searched in PATH) and capture its stdout. stderr is discarded.
    virtual CommandResult Capture(const Vector<String>& argv) = 0;

    /// Run argv[0] in `workDir`, appending stdout and stderr to `logFile`.
    virtual CommandResult RunLogged(const Vector<String>& argv,
                                    const Path& workDir,
                                    const Path& logFile) = 0;
};

/// fork/execvp based runner
class HB_API SystemCommandRunner final : public CommandRunner {
public:
    CommandResult Capture(const Vector<String>& argv) override;
    CommandResult RunLogged(const Vector<String>& argv,
                            const Path& workDir,
                            const Path& logFile) override;
};

/// Shell-style rendering of argv for log messages
String FormatCommandLine(const Vector<String>& argv);

} // namespace h5bind
