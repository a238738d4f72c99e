/**
 * @file process_utils.cpp
 * @brief Implementation of subprocess execution with deadline-based cancellation
 *
 * **Execution Model**:
 * ```
 * fork() ─┬─ child:  setpgid → dup2(stdin/stdout/stderr) → chdir → execvp
 *         └─ parent: poll(stdout, stderr, stdin) until EOF or deadline
 *                    → kill(-pgid, SIGKILL) on deadline
 *                    → waitpid()
 * ```
 *
 * The child gets its own process group so that a timeout also takes down
 * anything it spawned (a `docker exec` client, a shell pipeline, ...).
 *
 * @date 2025
 */

#include "envbox/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace envbox {
namespace utils {

namespace {

/**
 * @brief Owning wrapper around a POSIX file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int Get() const { return fd_; }
    bool IsOpen() const { return fd_ >= 0; }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Pipe MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void IgnoreSigpipeOnce() {
    // Writing stdin to a child that already exited must not kill us.
    static const bool ignored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/// Drain whatever is readable; returns false on EOF
bool DrainInto(int fd, std::string& sink) {
    std::array<char, 8192> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return false;
    }
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv,
                            const ProcessOptions& options,
                            int stdin_fd, int stdout_fd, int stderr_fd) {
    ::setpgid(0, 0);

    ::dup2(stdin_fd, STDIN_FILENO);
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    std::signal(SIGPIPE, SIG_DFL);

    if (options.working_dir && ::chdir(options.working_dir->c_str()) != 0) {
        const char* msg = "envbox: cannot change working directory\n";
        (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
        ::_exit(127);
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    ::execvp(cargv[0], cargv.data());

    const char* msg = "envbox: exec failed: ";
    (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
    (void)!::write(STDERR_FILENO, argv[0].c_str(), argv[0].size());
    (void)!::write(STDERR_FILENO, "\n", 1);
    ::_exit(127);
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    return status;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argument vector");
    }

    IgnoreSigpipeOnce();

    ProcessResult result;
    const auto start_time = std::chrono::steady_clock::now();

    Pipe out_pipe = MakePipe();
    Pipe err_pipe = MakePipe();
    Pipe in_pipe = MakePipe();

    FileDescriptor dev_null;
    if (options.stdin_data.empty()) {
        dev_null = FileDescriptor(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!dev_null.IsOpen()) {
            throw std::system_error(errno, std::generic_category(), "open /dev/null");
        }
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        int stdin_fd = options.stdin_data.empty() ? dev_null.Get() : in_pipe.read_end.Get();
        int stderr_fd = options.merge_stderr ? out_pipe.write_end.Get() : err_pipe.write_end.Get();
        ExecChild(argv, options, stdin_fd, out_pipe.write_end.Get(), stderr_fd);
    }

    // Mirror the child's setpgid to avoid racing kill(-pid) against exec
    ::setpgid(pid, pid);

    out_pipe.write_end.Close();
    err_pipe.write_end.Close();
    in_pipe.read_end.Close();
    if (options.stdin_data.empty()) {
        in_pipe.write_end.Close();
    }

    SetNonBlocking(out_pipe.read_end.Get());
    SetNonBlocking(err_pipe.read_end.Get());
    if (in_pipe.write_end.IsOpen()) {
        SetNonBlocking(in_pipe.write_end.Get());
    }

    std::size_t stdin_offset = 0;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = start_time + *options.timeout;
    }

    while (out_pipe.read_end.IsOpen() || err_pipe.read_end.IsOpen()) {
        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 1000));
        }

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int out_index = -1, err_index = -1, in_index = -1;
        if (out_pipe.read_end.IsOpen()) {
            out_index = static_cast<int>(count);
            fds[count++] = pollfd{out_pipe.read_end.Get(), POLLIN, 0};
        }
        if (err_pipe.read_end.IsOpen()) {
            err_index = static_cast<int>(count);
            fds[count++] = pollfd{err_pipe.read_end.Get(), POLLIN, 0};
        }
        if (in_pipe.write_end.IsOpen()) {
            in_index = static_cast<int>(count);
            fds[count++] = pollfd{in_pipe.write_end.Get(), POLLOUT, 0};
        }

        int rc = ::poll(fds.data(), count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(-pid, SIGKILL);
            WaitForChild(pid);
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (rc == 0) {
            continue;
        }

        if (out_index >= 0 && fds[out_index].revents != 0) {
            if (!DrainInto(out_pipe.read_end.Get(), result.stdout_output)) {
                out_pipe.read_end.Close();
            }
        }
        if (err_index >= 0 && fds[err_index].revents != 0) {
            if (!DrainInto(err_pipe.read_end.Get(), result.stderr_output)) {
                err_pipe.read_end.Close();
            }
        }
        if (in_index >= 0 && fds[in_index].revents != 0) {
            if (fds[in_index].revents & (POLLERR | POLLHUP)) {
                in_pipe.write_end.Close();
            } else {
                ssize_t n = ::write(in_pipe.write_end.Get(),
                                    options.stdin_data.data() + stdin_offset,
                                    options.stdin_data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    in_pipe.write_end.Close();
                }
                if (stdin_offset >= options.stdin_data.size()) {
                    in_pipe.write_end.Close();
                }
            }
        }
    }

    // Output closed; the child may still be running until the deadline
    if (!result.timed_out && deadline) {
        while (true) {
            int status = 0;
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);
                if (WIFEXITED(status)) {
                    result.exit_code = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    result.term_signal = WTERMSIG(status);
                    result.exit_code = 128 + result.term_signal;
                }
                return result;
            }
            if (r < 0 && errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "waitpid");
            }
            if (std::chrono::steady_clock::now() >= *deadline) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (result.timed_out) {
        spdlog::debug("Process {} exceeded its deadline, killing process group", argv[0]);
        ::kill(-pid, SIGKILL);
        WaitForChild(pid);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        result.exit_code.reset();
        result.term_signal = SIGKILL;
        return result;
    }

    int status = WaitForChild(pid);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    return result;
}

bool IsExecutableAvailable(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::string path(path_env);
    std::size_t begin = 0;
    while (begin <= path.size()) {
        std::size_t end = path.find(':', begin);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(begin, end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + program;
        struct stat st {};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        begin = end + 1;
    }
    return false;
}

} // namespace utils
} // namespace envbox
