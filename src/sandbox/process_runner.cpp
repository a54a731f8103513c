#include "process_runner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace toolcage {

namespace {

enum class SpawnStage : int { Chdir = 1, Exec = 2 };

// Written by the child over a close-on-exec pipe when it fails before exec.
// A successful exec closes the pipe and the parent reads EOF.
struct SpawnFailure {
    int stage;
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Child side: report the failing stage and exit without running atexit hooks.
[[noreturn]] void child_fail(int status_fd, SpawnStage stage) {
    SpawnFailure failure{static_cast<int>(stage), errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

struct CapturedStream {
    int fd = -1;
    std::string* sink = nullptr;
    bool truncated = false;
};

// Read what is available; returns false once the stream is finished.
bool drain_stream(CapturedStream& stream, size_t max_bytes) {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(stream.fd, buffer.data(), buffer.size());
    if (n > 0) {
        size_t room = max_bytes > stream.sink->size() ? max_bytes - stream.sink->size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        stream.sink->append(buffer.data(), take);
        if (take < static_cast<size_t>(n)) stream.truncated = true;
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;  // EOF or unrecoverable error
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void kill_and_reap(pid_t pid) {
    ::kill(-pid, SIGKILL);  // child called setsid(), so pid is its group id
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace

std::string describe_command(const Command& command) {
    if (const auto* shell = std::get_if<ShellCommand>(&command)) {
        return shell->line;
    }
    std::string out;
    for (const auto& arg : std::get<ArgvCommand>(command).argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

std::optional<ToolError> PosixProcessRunner::run(const Command& command,
                                                 const std::filesystem::path& working_dir,
                                                 std::chrono::seconds timeout,
                                                 ProcessOutput& out) {
    // Everything the child needs is prepared before fork().
    std::vector<std::string> args;
    if (const auto* shell = std::get_if<ShellCommand>(&command)) {
        args = {"/bin/sh", "-c", shell->line};
    } else {
        args = std::get<ArgvCommand>(command).argv;
    }
    if (args.empty() || args.front().empty()) {
        return ToolError{ErrorKind::Validation, "Empty command"};
    }

    std::vector<char*> cargv;
    cargv.reserve(args.size() + 1);
    for (auto& arg : args) cargv.push_back(arg.data());
    cargv.push_back(nullptr);
    const std::string cwd = working_dir.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(status_pipe) != 0) {
        std::string err = std::strerror(errno);
        for (int* p : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return ToolError{ErrorKind::Spawn, "Failed to create pipes: " + err};
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = std::strerror(errno);
        for (int* p : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return ToolError{ErrorKind::Spawn, "Failed to fork process: " + err};
    }

    if (pid == 0) {
        // Child process: detach from controlling terminal
        setsid();
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);
        ::close(status_pipe[0]);

        if (chdir(cwd.c_str()) != 0) child_fail(status_pipe[1], SpawnStage::Chdir);
        execvp(cargv[0], cargv.data());
        child_fail(status_pipe[1], SpawnStage::Exec);
    }

    // Parent process
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    SpawnFailure failure{};
    ssize_t got;
    do {
        got = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

        std::string reason = std::strerror(failure.error);
        std::string message =
            failure.stage == static_cast<int>(SpawnStage::Chdir)
                ? "Cannot enter working directory " + cwd + ": " + reason
                : "Failed to start '" + args.front() + "': " + reason;
        std::cerr << "[process] " << message << "\n";
        return ToolError{ErrorKind::Spawn, message};
    }

    out = ProcessOutput{};
    CapturedStream streams[2] = {
        {stdout_pipe[0], &out.stdout_data},
        {stderr_pipe[0], &out.stderr_data},
    };

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining_ms = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };
    auto timed_out = [&]() -> ToolError {
        for (auto& s : streams) close_fd(s.fd);
        kill_and_reap(pid);
        std::cerr << "[process] Timed out after " << timeout.count()
                  << "s: " << describe_command(command) << "\n";
        return ToolError{ErrorKind::Timeout,
                         "Command timed out after " + std::to_string(timeout.count()) +
                             " seconds"};
    };

    while (streams[0].fd >= 0 || streams[1].fd >= 0) {
        int wait_ms = remaining_ms();
        if (wait_ms <= 0) return timed_out();

        struct pollfd pfds[2];
        nfds_t count = 0;
        CapturedStream* polled[2];
        for (auto& s : streams) {
            if (s.fd < 0) continue;
            pfds[count].fd = s.fd;
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            polled[count] = &s;
            ++count;
        }

        int ret = poll(pfds, count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) return timed_out();

        for (nfds_t i = 0; i < count; ++i) {
            if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            if (!drain_stream(*polled[i], max_output_bytes_)) close_fd(polled[i]->fd);
        }
    }
    for (auto& s : streams) close_fd(s.fd);

    // Both streams closed; the process may still be running.
    int status = 0;
    while (true) {
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) break;
        if (reaped < 0 && errno != EINTR) {
            return ToolError{ErrorKind::Spawn,
                             std::string("Failed to wait for process: ") + std::strerror(errno)};
        }
        if (remaining_ms() <= 0) return timed_out();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    for (auto& s : streams) {
        if (s.truncated) *s.sink += "\n[truncated]";
    }
    out.exit_code = decode_exit_status(status);
    out.success = out.exit_code == 0;
    return std::nullopt;
}

} // namespace toolcage
