#include "runtime/runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace stepgate::runtime {

using core::errors::ErrorCategory;
using core::errors::StepError;

namespace {

constexpr int kPollTimeoutMs = 50;

// Where one of the child's streams ends up: our own stream, plus an optional file.
struct OutputSink {
    int fd = -1;
    bool open = false;
    std::ostream* forward = nullptr;
    std::unique_ptr<std::ofstream> tee;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] != -1) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(OutputSink& sink) {
    if (!sink.open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(sink.fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.forward->write(buffer, n);
            sink.forward->flush();
            if (sink.tee) {
                sink.tee->write(buffer, n);
                sink.tee->flush();
            }
            continue;
        }
        if (n == 0) {
            sink.open = false;
            static_cast<void>(close(sink.fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        sink.open = false;
        static_cast<void>(close(sink.fd));
        return;
    }
}

core::errors::Result<std::unique_ptr<std::ofstream>> open_tee(
    const std::optional<std::filesystem::path>& path) {
    if (!path.has_value() || path->empty()) {
        return std::unique_ptr<std::ofstream>();
    }

    std::error_code ec;
    if (path->has_parent_path()) {
        std::filesystem::create_directories(path->parent_path(), ec);
        if (ec) {
            return StepError{ErrorCategory::Internal,
                             "Unable to create directory for " + path->string(),
                             "output_dir_create_failed"};
        }
    }

    auto out = std::make_unique<std::ofstream>(*path, std::ios::binary | std::ios::trunc);
    if (!out->is_open()) {
        return StepError{ErrorCategory::Internal,
                         "Unable to open output file: " + path->string(),
                         "output_open_failed"};
    }
    return out;
}

std::vector<std::string> build_environment(
    const std::map<std::string, std::string>& environment) {
    std::vector<std::string> entries;
    entries.reserve(environment.size());
    for (const auto& [key, value] : environment) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

}  // namespace

ProcessRunner::ProcessRunner(ProcessRunnerOptions options)
    : options_(std::move(options)) {}

core::errors::Status ProcessRunner::run(
    const CancelContext& ctx, const std::vector<std::string>& args,
    const std::map<std::string, std::string>& environment) {
    if (args.empty() || args.front().empty()) {
        return core::errors::ok();
    }
    if (auto ctx_err = ctx.err()) {
        return ctx_err.value();
    }

    auto stdout_tee = open_tee(options_.stdout_path);
    if (core::errors::is_error(stdout_tee)) {
        return core::errors::get_error(stdout_tee);
    }
    auto stderr_tee = open_tee(options_.stderr_path);
    if (core::errors::is_error(stderr_tee)) {
        return core::errors::get_error(stderr_tee);
    }

    // Everything the child needs is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const auto env_entries = build_environment(environment);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (const auto& entry : env_entries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return StepError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return StepError{ErrorCategory::Internal, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        environ = envp.data();
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));

    // exec_pipe closes on a successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t exec_read = 0;
    do {
        exec_read = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    static_cast<void>(close(exec_pipe[0]));
    if (exec_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        return StepError{ErrorCategory::Run,
                         "exec: \"" + args.front() + "\": " + std::strerror(exec_errno),
                         "start_failed"};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    OutputSink out_sink{stdout_pipe[0], true, &std::cout,
                        std::move(std::get<std::unique_ptr<std::ofstream>>(stdout_tee))};
    OutputSink err_sink{stderr_pipe[0], true, &std::cerr,
                        std::move(std::get<std::unique_ptr<std::ofstream>>(stderr_tee))};

    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (out_sink.open || err_sink.open || !child_exited) {
        if (!child_exited && !killed && ctx.done()) {
            LOG_DEBUG("ProcessRunner: context done, killing pid " + std::to_string(pid));
            killed = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_sink.open) {
            fds[nfds].fd = out_sink.fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err_sink.open) {
            fds[nfds].fd = err_sink.fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, kPollTimeoutMs));
        } else {
            static_cast<void>(ctx.wait_for(std::chrono::milliseconds(kPollTimeoutMs)));
        }

        drain_pipe(out_sink);
        drain_pipe(err_sink);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // Grandchildren may hold the pipes open after a kill; stop reading then.
        if (child_exited && killed) {
            break;
        }
    }

    if (out_sink.open) {
        static_cast<void>(close(out_sink.fd));
    }
    if (err_sink.open) {
        static_cast<void>(close(err_sink.fd));
    }

    if (killed) {
        return ctx.err().value_or(core::errors::context_canceled());
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return core::errors::ok();
    }

    StepError exit_error{ErrorCategory::Run, "", "exit_error"};
    if (WIFEXITED(status)) {
        exit_error.exit_code = WEXITSTATUS(status);
        exit_error.message = "exit status " + std::to_string(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        // The status of a signalled child is reported as undetermined.
        exit_error.exit_code = -1;
        exit_error.message = "signal: " + std::string(strsignal(WTERMSIG(status)));
    } else {
        exit_error.exit_code = -1;
        exit_error.message = "unknown exit status";
    }
    return exit_error;
}

}  // namespace stepgate::runtime
