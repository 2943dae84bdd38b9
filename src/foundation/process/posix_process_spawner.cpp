/// @file posix_process_spawner.cpp
/// @brief PosixProcessSpawner: fork/execvp/waitpid/kill.

#include "sgw/foundation/process_spawner.hpp"

#include "sgw/foundation/service_logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sgw::foundation {

std::string LaunchSpec::describe() const {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

std::string ProcessExit::describe() const {
    if (signal != 0) {
        return "pid " + std::to_string(pid) + " killed by signal " + std::to_string(signal);
    }
    return "pid " + std::to_string(pid) + " exited with code " + std::to_string(exitCode);
}

// ---------------------------------------------------------------------------
// spawn()
// ---------------------------------------------------------------------------
ServiceResult<ProcessId> PosixProcessSpawner::spawn(const LaunchSpec& spec) {
    if (spec.empty()) {
        return ServiceResult<ProcessId>::err(
            ServiceError(ErrorCode::NoLaunchCommand, "no engine launch command configured"));
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd < 0 || maxFd > 65536) {
        maxFd = 65536;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return ServiceResult<ProcessId>::err(
            ServiceError(ErrorCode::SpawnFailed,
                         std::string("fork failed: ") + std::strerror(errno)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        for (long fd = 3; fd < maxFd; ++fd) {
            ::close(static_cast<int>(fd));
        }
        if (!spec.workingDirectory.empty() && ::chdir(spec.workingDirectory.c_str()) != 0) {
            std::perror("chdir");
            ::_exit(126);
        }
        ::execvp(argv[0], argv.data());
        std::perror("execvp");
        ::_exit(127);
    }

    SGW_LOG_INFO(LogCategory::Process,
                 "spawned pid " + std::to_string(pid) + ": " + spec.describe());
    return ServiceResult<ProcessId>::ok(static_cast<ProcessId>(pid));
}

// ---------------------------------------------------------------------------
// poll()
// ---------------------------------------------------------------------------
std::optional<ProcessExit> PosixProcessSpawner::poll(ProcessId pid) {
    if (pid <= 0) {
        return std::nullopt;
    }

    int status = 0;
    pid_t reaped = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
    if (reaped == 0) {
        return std::nullopt;
    }

    ProcessExit ended;
    ended.pid = pid;
    if (reaped < 0) {
        // ECHILD: already reaped elsewhere; report it gone.
        ended.exitCode = -1;
        return ended;
    }
    if (WIFEXITED(status)) {
        ended.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        ended.signal = WTERMSIG(status);
    }
    return ended;
}

// ---------------------------------------------------------------------------
// terminate() / kill()
// ---------------------------------------------------------------------------
ServiceResult<void> PosixProcessSpawner::terminate(ProcessId pid) {
    if (pid <= 0 || ::kill(static_cast<pid_t>(pid), SIGTERM) != 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::SignalFailed,
                         "SIGTERM to pid " + std::to_string(pid) + " failed"));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> PosixProcessSpawner::kill(ProcessId pid) {
    if (pid <= 0 || ::kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::SignalFailed,
                         "SIGKILL to pid " + std::to_string(pid) + " failed"));
    }
    SGW_LOG_WARN(LogCategory::Process, "killed pid " + std::to_string(pid));
    return ServiceResult<void>::ok();
}

} // namespace sgw::foundation
