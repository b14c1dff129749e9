/**
 * @file process_utils.cpp
 * @brief fork/execvp based subprocess runner with cancellation
 *
 * @date 2025
 */

#include "sandexec/utils/process_utils.hpp"
#include "sandexec/utils/string_utils.hpp"
#include "sandexec/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandexec {
namespace utils {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::size_t kReadChunk = 64 * 1024;

std::once_flag g_sigpipe_once;

// A closed peer must surface as EPIPE on write, not kill the process
void IgnoreSigpipe() {
    std::call_once(g_sigpipe_once, []() {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

std::string ErrnoMessage(int error) {
    return std::strerror(error);
}

/**
 * Owned file descriptor, closed on destruction.
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

void OpenPipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw ProcessError("Failed to create pipe: " + ErrnoMessage(errno));
    }
    p.read_end = FileDescriptor(fds[0]);
    p.write_end = FileDescriptor(fds[1]);
}

/**
 * Kills and reaps the child unless it has already been reaped.
 */
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}

    ~ChildGuard() {
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    pid_t Get() const { return pid_; }
    void MarkReaped() { pid_ = -1; }

private:
    pid_t pid_;
};

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

[[noreturn]] void ThrowCancelled(const core::CancellationToken& token, const std::string& program) {
    bool deadline = token.Reason() == core::CancelReason::DEADLINE_EXCEEDED;
    throw core::OperationCancelledError(
        program + (deadline ? " interrupted: deadline exceeded" : " interrupted: cancelled"),
        deadline);
}

/// Drain readable data into buffer; closes the descriptor on EOF or error
void ReadAvailable(FileDescriptor& fd, std::string& buffer) {
    char chunk[kReadChunk];
    ssize_t n = ::read(fd.Get(), chunk, sizeof(chunk));
    if (n > 0) {
        buffer.append(chunk, static_cast<std::size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fd.Close();
    }
}

} // anonymous namespace

// ============================================================================
// ProcessRunner
// ============================================================================

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const core::CancellationToken& token,
                                 const ProcessOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        throw ProcessError("Empty command");
    }
    if (token.IsCancelled()) {
        ThrowCancelled(token, argv[0]);
    }

    IgnoreSigpipe();

    const auto start_time = std::chrono::steady_clock::now();

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    Pipe stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe;
    OpenPipe(stdin_pipe);
    OpenPipe(stdout_pipe);
    OpenPipe(stderr_pipe);
    OpenPipe(exec_pipe);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError("Failed to fork: " + ErrnoMessage(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        std::signal(SIGPIPE, SIG_DFL);
        sigset_t unblocked;
        sigemptyset(&unblocked);
        ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);

        ::dup2(stdin_pipe.read_end.Get(), STDIN_FILENO);
        ::dup2(stdout_pipe.write_end.Get(), STDOUT_FILENO);
        ::dup2(stderr_pipe.write_end.Get(), STDERR_FILENO);

        ::execvp(c_argv[0], c_argv.data());

        int error = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.Get(), &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    ChildGuard child(pid);

    stdin_pipe.read_end.Close();
    stdout_pipe.write_end.Close();
    stderr_pipe.write_end.Close();
    exec_pipe.write_end.Close();

    // The exec pipe is close-on-exec: EOF means execvp succeeded
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe.read_end.Get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        throw ProcessError("Failed to execute " + argv[0] + ": " + ErrnoMessage(exec_errno));
    }

    spdlog::trace("Spawned {} (pid {})", argv[0], pid);

    ProcessResult result;
    std::size_t stdin_offset = 0;

    if (options.stdin_data.empty()) {
        stdin_pipe.write_end.Close();
    } else {
        int flags = ::fcntl(stdin_pipe.write_end.Get(), F_GETFL);
        ::fcntl(stdin_pipe.write_end.Get(), F_SETFL, flags | O_NONBLOCK);
    }

    // ========================================================================
    // I/O loop
    // ========================================================================

    while (stdout_pipe.read_end.IsOpen() || stderr_pipe.read_end.IsOpen() ||
           stdin_pipe.write_end.IsOpen()) {

        if (token.IsCancelled()) {
            ThrowCancelled(token, argv[0]);
        }

        std::vector<pollfd> fds;
        FileDescriptor* owners[3];
        std::size_t count = 0;

        auto watch = [&](FileDescriptor& fd, short events) {
            if (fd.IsOpen()) {
                fds.push_back(pollfd{fd.Get(), events, 0});
                owners[count++] = &fd;
            }
        };
        watch(stdin_pipe.write_end, POLLOUT);
        watch(stdout_pipe.read_end, POLLIN);
        watch(stderr_pipe.read_end, POLLIN);

        int ready = ::poll(fds.data(), fds.size(), kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ProcessError("poll failed: " + ErrnoMessage(errno));
        }
        if (ready == 0) {
            continue;
        }

        for (std::size_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            FileDescriptor& fd = *owners[i];

            if (&fd == &stdin_pipe.write_end) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    fd.Close();
                    continue;
                }
                const char* data = options.stdin_data.data() + stdin_offset;
                std::size_t remaining = options.stdin_data.size() - stdin_offset;
                ssize_t written = ::write(fd.Get(), data, remaining);
                if (written > 0) {
                    stdin_offset += static_cast<std::size_t>(written);
                    if (stdin_offset == options.stdin_data.size()) {
                        fd.Close();
                    }
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    // Child stopped reading (EPIPE); remaining input is dropped
                    fd.Close();
                }
            } else if (&fd == &stdout_pipe.read_end) {
                ReadAvailable(fd, result.stdout_output);
            } else {
                ReadAvailable(fd, result.stderr_output);
            }
        }
    }

    // ========================================================================
    // Reap
    // ========================================================================

    int status = 0;
    while (true) {
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            child.MarkReaped();
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            child.MarkReaped();
            throw ProcessError("waitpid failed: " + ErrnoMessage(errno));
        }
        if (token.WaitFor(std::chrono::milliseconds(10))) {
            ThrowCancelled(token, argv[0]);
        }
    }

    result.exit_code = DecodeWaitStatus(status);
    result.success = (result.exit_code == 0);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

bool ProcessRunner::IsExecutableAvailable(const std::string& program) {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return false;
    }
    for (const auto& dir : StringUtils::Split(path, ':')) {
        std::string candidate = dir + "/" + program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace utils
} // namespace sandexec
