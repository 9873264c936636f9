#include "mcpconf/process.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace {

constexpr int kPollSliceMs = 100;

// argv must be built before fork(); the child only calls async-signal-safe functions.
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    Argv(const std::string& program, const std::vector<std::string>& args) {
        storage.push_back(program);
        storage.insert(storage.end(), args.begin(), args.end());
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
};

void redirect_stdin_to_devnull() {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        if (devnull != STDIN_FILENO) ::close(devnull);
    }
}

// Reads the exec status pipe: returns 0 when exec succeeded (pipe closed by
// O_CLOEXEC), otherwise the child's errno.
int read_exec_errno(int fd) {
    int err = 0;
    ssize_t n;
    do {
        n = ::read(fd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

ProcessResult run_process(const std::string& program, const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout) {
    ProcessResult result;
    Argv argv(program, args);

    int out_pipe[2], exec_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        result.output = std::string("Failed to create pipe: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.output = std::string("Failed to create pipe: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.output = std::string("Failed to fork process: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return result;
    }
    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole tree
        ::setpgid(0, 0);
        redirect_stdin_to_devnull();
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::execvp(argv.ptrs[0], argv.ptrs.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::close(out_pipe[1]);
    ::close(exec_pipe[1]);

    int exec_errno = read_exec_errno(exec_pipe[0]);
    ::close(exec_pipe[0]);
    if (exec_errno != 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(out_pipe[0]);
        result.output = "Cannot execute '" + program + "': " + std::strerror(exec_errno);
        return result;
    }
    result.started = true;
    spdlog::debug("Started '{}' (pid {})", program, pid);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[4096];
    bool out_open = true;
    bool exited = false;
    int status = 0;

    while (true) {
        if (!exited) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
        }
        if (exited && !out_open) break;

        auto now = std::chrono::steady_clock::now();
        if (!exited && now >= deadline) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            result.timed_out = true;
            break;
        }

        if (!out_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        // Once the child is gone only drain what is already buffered; a
        // grandchild may still hold the write end open.
        int wait_ms = exited ? 0 : static_cast<int>(std::min<long long>(
            kPollSliceMs,
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()));
        struct pollfd pfd{};
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            out_open = false;
            continue;
        }
        if (ret == 0) {
            if (exited) out_open = false;
            continue;
        }

        ssize_t n = ::read(out_pipe[0], chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            out_open = false;
        } else if (n == 0) {
            out_open = false;
        } else {
            result.output.append(chunk, static_cast<size_t>(n));
        }
    }
    ::close(out_pipe[0]);

    if (!result.timed_out) {
        result.exit_code = decode_status(status);
    }
    spdlog::debug("'{}' finished: exit={} timed_out={}", program, result.exit_code, result.timed_out);
    return result;
}

bool spawn_detached(const std::string& program, const std::vector<std::string>& args) {
    Argv argv(program, args);

    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) return false;

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return false;
    }
    if (pid == 0) {
        // Intermediate child: new session, then fork the real process so it
        // is reparented and never becomes our zombie.
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) ::_exit(grandchild < 0 ? 1 : 0);

        redirect_stdin_to_devnull();
        ::dup2(STDIN_FILENO, STDOUT_FILENO);
        ::dup2(STDIN_FILENO, STDERR_FILENO);
        ::execvp(argv.ptrs[0], argv.ptrs.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(exec_pipe[1]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    int exec_errno = read_exec_errno(exec_pipe[0]);
    ::close(exec_pipe[0]);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::warn("Failed to fork '{}'", program);
        return false;
    }
    if (exec_errno != 0) {
        spdlog::warn("Cannot execute '{}': {}", program, std::strerror(exec_errno));
        return false;
    }
    return true;
}

} // namespace mcpconf
