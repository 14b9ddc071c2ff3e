//! # Subprocess Execution
//!
//! fork + execvp with three pipes. The parent multiplexes stdin writes and
//! stdout/stderr reads with poll() so a chatty child can never block on a
//! full pipe while we wait for it.

#include "process/subprocess.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace relpack::process {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// A pipe whose ends are close-on-exec, so children started concurrently by
/// other threads never inherit them. dup2() clears the flag on the copies a
/// child installs as its stdio.
static int open_pipe(int fds[2]) {
#if defined(__APPLE__)
    if (pipe(fds) != 0)
        return -1;
    for (int i = 0; i < 2; ++i) {
        if (fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0) {
            int saved = errno;
            close_fd(fds[0]);
            close_fd(fds[1]);
            errno = saved;
            return -1;
        }
    }
    return 0;
#else
    return pipe2(fds, O_CLOEXEC);
#endif
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    ProcessResult result;
    if (argv.empty()) {
        result.stderr_output = "empty command line";
        return result;
    }

    RELPACK_LOG_DEBUG("process", "exec: " << format_command(argv));

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (open_pipe(in_pipe) != 0 || open_pipe(out_pipe) != 0 || open_pipe(err_pipe) != 0) {
        result.stderr_output = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = std::string("failed to fork: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(126);
        }
        for (const auto& [key, value] : options.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        std::vector<char*> c_args;
        c_args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            c_args.push_back(const_cast<char*>(a.c_str()));
        }
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    result.launched = true;

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    signal(SIGPIPE, SIG_IGN);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    size_t stdin_written = 0;
    if (options.stdin_data.empty()) {
        close_fd(in_fd);
    } else {
        fcntl(in_fd, F_SETFL, O_NONBLOCK);
    }

    bool has_deadline = options.timeout_seconds > 0;
    auto deadline = start + std::chrono::seconds(options.timeout_seconds);
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        std::vector<pollfd> fds;
        if (out_fd >= 0)
            fds.push_back({out_fd, POLLIN, 0});
        if (err_fd >= 0)
            fds.push_back({err_fd, POLLIN, 0});
        if (in_fd >= 0)
            fds.push_back({in_fd, POLLOUT, 0});

        int wait_ms = 100;
        if (has_deadline && Clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            break;
        }

        for (const auto& p : fds) {
            if (p.revents == 0)
                continue;

            if (p.fd == in_fd) {
                ssize_t n = write(in_fd, options.stdin_data.data() + stdin_written,
                                  options.stdin_data.size() - stdin_written);
                if (n > 0)
                    stdin_written += static_cast<size_t>(n);
                if (n < 0 || stdin_written >= options.stdin_data.size())
                    close_fd(in_fd);
                continue;
            }

            ssize_t n = read(p.fd, buf, sizeof(buf));
            if (n <= 0) {
                if (p.fd == out_fd)
                    close_fd(out_fd);
                else
                    close_fd(err_fd);
                continue;
            }

            if (p.fd == out_fd) {
                result.stdout_output.append(buf, static_cast<size_t>(n));
                if (options.echo_output)
                    std::cout.write(buf, n).flush();
            } else {
                result.stderr_output.append(buf, static_cast<size_t>(n));
                if (options.echo_output)
                    std::cerr.write(buf, n).flush();
            }
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    if (!result.timed_out) {
        // The child may close its output early and keep running.
        while (true) {
            pid_t ret = waitpid(pid, &status, has_deadline ? WNOHANG : 0);
            if (ret == pid)
                break;
            if (ret < 0 && errno != EINTR)
                break;
            if (has_deadline && Clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            if (ret == 0)
                usleep(1000);
        }
    }

    if (result.timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.exit_code = -1;
        result.stderr_output +=
            "\nprocess timed out after " + std::to_string(options.timeout_seconds) + "s";
    } else {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else {
            result.exit_code = -1;
        }
        // 127 from our own _exit means execvp failed.
        if (result.exit_code == 127 && result.stdout_output.empty() &&
            result.stderr_output.empty()) {
            result.launched = false;
            result.stderr_output = "command not found: " + argv[0];
        }
    }

    auto end = Clock::now();
    result.duration_us =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();

    RELPACK_LOG_TRACE("process", argv[0] << " exited with " << result.exit_code << " after "
                                         << result.duration_us / 1000 << " ms");
    return result;
}

bool is_executable(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    return access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_program(std::string_view name) {
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos) {
        fs::path direct(name);
        if (is_executable(direct))
            return direct;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_list = path_env ? path_env : "/usr/bin:/bin";

    size_t pos = 0;
    while (pos <= path_list.size()) {
        size_t colon = path_list.find(':', pos);
        if (colon == std::string::npos)
            colon = path_list.size();

        std::string dir = path_list.substr(pos, colon - pos);
        if (dir.empty())
            dir = ".";
        fs::path candidate = fs::path(dir) / std::string(name);
        if (is_executable(candidate))
            return candidate;

        pos = colon + 1;
    }
    return std::nullopt;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty())
            out += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"';
            out += arg;
            out += '"';
        } else {
            out += arg;
        }
    }
    return out;
}

} // namespace relpack::process
