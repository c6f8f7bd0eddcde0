#include <fencelint/process.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fencelint {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Pipes are close-on-exec so a child spawned by another worker thread never
// inherits them (an inherited stdin write end would keep that child's
// analyzer waiting for EOF).
static int make_pipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC);
#else
    if (pipe(fds) != 0) return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void ignore_sigpipe() {
    static const bool ignored = [] {
        signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

static void drain(int fd, std::string& out) {
    if (fd < 0) return;
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const std::optional<std::string>& input) {
    if (args.empty()) {
        return FencelintError{FencelintError::InvalidArg, "run_command: empty args"};
    }

    // An analyzer that exits before reading all of stdin must not kill us
    ignore_sigpipe();

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};

    if (make_pipe(stdout_pipe) != 0 || make_pipe(stderr_pipe) != 0 ||
        (input.has_value() && make_pipe(stdin_pipe) != 0)) {
        std::string reason = strerror(errno);
        for (int* p : {stdout_pipe, stderr_pipe, stdin_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return FencelintError{FencelintError::IO, "pipe() failed: " + reason};
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = strerror(errno);
        for (int* p : {stdout_pipe, stderr_pipe, stdin_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return FencelintError{FencelintError::IO, "fork() failed: " + reason};
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        if (input.has_value()) {
            dup2(stdin_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(kExecFailedExitCode);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(kExecFailedExitCode);  // execvp failed
    }

    // Parent process
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdin_pipe[0]);

    // Set non-blocking on our ends
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);
    if (stdin_pipe[1] >= 0) fcntl(stdin_pipe[1], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    size_t written = 0;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
            close_fd(stdin_pipe[1]);
            return FencelintError{FencelintError::Timeout,
                "command timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        // Feed stdin until the payload is exhausted, then signal EOF
        if (stdin_pipe[1] >= 0) {
            const std::string& payload = input.value();
            bool broken = false;
            while (written < payload.size()) {
                ssize_t n = write(stdin_pipe[1], payload.data() + written,
                                  payload.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                // EPIPE: the child stopped reading
                if (n < 0 && errno != EAGAIN) broken = true;
                break;
            }
            if (written >= payload.size() || broken) {
                close_fd(stdin_pipe[1]);
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);

            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
            close_fd(stdin_pipe[1]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0 && errno != EINTR) {
            std::string reason = strerror(errno);
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
            close_fd(stdin_pipe[1]);
            return FencelintError{FencelintError::IO, "waitpid failed: " + reason};
        }

        // Brief sleep to avoid busy-wait
        usleep(1000);  // 1ms
    }
}

std::string format_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos) {
            out += '\'';
            out += a;
            out += '\'';
        } else {
            out += a;
        }
    }
    return out;
}

} // namespace fencelint
