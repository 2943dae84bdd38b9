#pragma once

/// @file process_spawner.hpp
/// @brief Non-blocking child process control used to launch the engine.

#include <optional>
#include <string>
#include <vector>

#include "sgw/foundation/service_result.hpp"

namespace sgw::foundation {

/// What to run: argv[0] is looked up on PATH when it has no slash.
struct LaunchSpec {
    std::vector<std::string> argv;
    std::string workingDirectory;

    [[nodiscard]] bool empty() const noexcept { return argv.empty(); }

    /// argv joined with spaces, for log lines.
    [[nodiscard]] std::string describe() const;
};

using ProcessId = int;

/// How a reaped child ended.
struct ProcessExit {
    ProcessId pid = 0;
    int exitCode = 0;    ///< valid when signal == 0
    int signal = 0;      ///< terminating signal, 0 for a normal exit

    [[nodiscard]] bool clean() const noexcept { return signal == 0 && exitCode == 0; }
    [[nodiscard]] std::string describe() const;
};

/// Process control seam. The gateway supervisor only talks to this
/// interface so tests can drive it with a scripted fake.
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    /// Start a child and return immediately.
    virtual ServiceResult<ProcessId> spawn(const LaunchSpec& spec) = 0;

    /// Reap @p pid if it has exited. nullopt while it is still running.
    virtual std::optional<ProcessExit> poll(ProcessId pid) = 0;

    /// Ask the child to exit (SIGTERM).
    virtual ServiceResult<void> terminate(ProcessId pid) = 0;

    /// Force the child to exit (SIGKILL).
    virtual ServiceResult<void> kill(ProcessId pid) = 0;
};

/// fork/execvp implementation.
///
/// The child gets its own process group, so a Ctrl-C aimed at the gateway's
/// terminal reaches the engine only through the control channel, and
/// inherits no descriptors beyond stdin/stdout/stderr.
class PosixProcessSpawner final : public ProcessSpawner {
public:
    ServiceResult<ProcessId> spawn(const LaunchSpec& spec) override;
    std::optional<ProcessExit> poll(ProcessId pid) override;
    ServiceResult<void> terminate(ProcessId pid) override;
    ServiceResult<void> kill(ProcessId pid) override;
};

} // namespace sgw::foundation
