#include "CommandRunner.hpp"
#include "core/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace h5bind {

String FormatCommandLine(const Vector<String>& argv) {
    String out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        if (arg.find_first_of(" \t\"'") == String::npos && !arg.empty()) {
            out += arg;
        } else {
            out += '\'';
            out += arg;
            out += '\'';
        }
    }
    return out;
}

namespace {

Vector<char*> MakeArgv(const Vector<String>& argv) {
    Vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    return cargv;
}

i32 WaitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            HB_LOG_ERROR("waitpid({}) failed: {}", static_cast<long>(pid), std::strerror(errno));
            return 127;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 127;
}

// Child side of a failed exec: report on the redirected stderr and leave
// without running atexit handlers of the parent image.
[[noreturn]] void ExitChild(const char* what, const char* detail) {
    const char* reason = std::strerror(errno);
    dprintf(STDERR_FILENO, "h5bind: %s %s: %s\n", what, detail, reason);
    _exit(127);
}

} // namespace

CommandResult SystemCommandRunner::Capture(const Vector<String>& argv) {
    CommandResult result;
    if (argv.empty()) {
        result.exitStatus = 127;
        return result;
    }

    int fds[2];
    if (pipe(fds) != 0) {
        HB_LOG_ERROR("pipe() failed: {}", std::strerror(errno));
        result.exitStatus = 127;
        return result;
    }

    Vector<char*> cargv = MakeArgv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        HB_LOG_ERROR("fork() failed: {}", std::strerror(errno));
        close(fds[0]);
        close(fds[1]);
        result.exitStatus = 127;
        return result;
    }

    if (pid == 0) {
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        close(fds[1]);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    close(fds[1]);
    char buffer[4096];
    for (;;) {
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<usize>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(fds[0]);

    result.exitStatus = WaitForChild(pid);
    HB_LOG_TRACE("{} -> exit {}", FormatCommandLine(argv), result.exitStatus);
    return result;
}

CommandResult SystemCommandRunner::RunLogged(const Vector<String>& argv,
                                             const Path& workDir,
                                             const Path& logFile) {
    CommandResult result;
    if (argv.empty()) {
        result.exitStatus = 127;
        return result;
    }

    int logFd = open(logFile.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (logFd < 0) {
        HB_LOG_ERROR("Cannot open build log {}: {}", logFile.string(), std::strerror(errno));
        result.exitStatus = 127;
        return result;
    }

    dprintf(logFd, "$ %s\n", FormatCommandLine(argv).c_str());

    Vector<char*> cargv = MakeArgv(argv);
    String dir = workDir.string();
    pid_t pid = fork();
    if (pid < 0) {
        HB_LOG_ERROR("fork() failed: {}", std::strerror(errno));
        close(logFd);
        result.exitStatus = 127;
        return result;
    }

    if (pid == 0) {
        dup2(logFd, STDOUT_FILENO);
        dup2(logFd, STDERR_FILENO);
        close(logFd);
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            ExitChild("cannot enter", dir.c_str());
        }
        execvp(cargv[0], cargv.data());
        ExitChild("cannot execute", cargv[0]);
    }

    close(logFd);
    result.exitStatus = WaitForChild(pid);
    HB_LOG_DEBUG("{} -> exit {}", FormatCommandLine(argv), result.exitStatus);
    return result;
}

} // namespace h5bind
