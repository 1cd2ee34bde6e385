#include "core/ShellSession.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {
[[noreturn]] void execShell(const std::string& command, const std::optional<fs::path>& dir) {
    setpgid(0, 0);
    if (dir && chdir(dir->c_str()) != 0) {
        _exit(127);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
}

std::string systemError(const std::string& what) {
    return what + ": " + std::strerror(errno);
}
} // namespace

PosixShellSession::PosixShellSession(const Workspace& workspace, bool captureOutput)
    : workspace(workspace), captureOutput(captureOutput) {}

std::string PosixShellSession::execute(const std::string& command, std::chrono::milliseconds timeout) {
    // 其他并发 fork 出的子进程不能继承写端,否则读不到 EOF
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw ToolError(ErrorKind::Internal, systemError("Failed to create pipe"));
    }

    auto dir = workspace.tryRoot();
    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        throw ToolError(ErrorKind::Internal, systemError("Failed to fork"));
    }
    if (pid == 0) {
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[1]);
        execShell(command, dir);
    }

    close(fds[1]);
    // 父进程也设一次,避免与子进程 setpgid 竞争
    setpgid(pid, pid);

    std::string output;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timedOut = false;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }

        struct pollfd pfd{fds[0], POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    close(fds[0]);

    if (timedOut) {
        kill(-pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        throw TimeoutError("Command timed out after " + std::to_string(timeout.count()) + "ms");
    }

    int status = 0;
    waitpid(pid, &status, 0);
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        Logger::getInstance().debug("[Shell] Command exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    return output;
}

void PosixShellSession::sendText(const std::string& command) {
    auto dir = workspace.tryRoot();
    pid_t pid = fork();
    if (pid < 0) {
        throw ToolError(ErrorKind::Internal, systemError("Failed to fork"));
    }
    if (pid == 0) {
        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }
        execShell(command, dir);
    }

    Logger::getInstance().info("[Shell] Sent command (pid " + std::to_string(pid) + "): " + command);
    std::thread([pid]() { waitpid(pid, nullptr, 0); }).detach();
}
