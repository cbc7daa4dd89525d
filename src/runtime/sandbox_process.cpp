#include "runtime/sandbox_process.hpp"
#include "runtime/errors.hpp"
#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <thread>
#include <vector>

namespace wasmbox::runtime {

constexpr size_t IO_CHUNK = 64 * 1024;

// ============================================================================
// Utility
// ============================================================================

const char* termination_to_string(Termination termination) {
    switch (termination) {
        case Termination::EXITED:       return "EXITED";
        case Termination::TIMED_OUT:    return "TIMED_OUT";
        case Termination::OUTPUT_LIMIT: return "OUTPUT_LIMIT";
        default: return "UNKNOWN";
    }
}

namespace {

// Blocks SIGPIPE on this thread while stdin is written. A SIGPIPE raised
// by writing to a sandbox that stopped reading is consumed on exit
// instead of terminating the host.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_mask_);
    }

    ~SigpipeGuard() {
        if (!was_pending_) {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&sigpipe_, nullptr, &zero) == SIGPIPE) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t sigpipe_;
    sigset_t old_mask_;
    bool was_pending_ = false;
};

// Child side: report errno to the parent and exit
[[noreturn]] void child_fail(int report_fd) {
    int err = errno;
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

// ============================================================================
// SandboxProcess Implementation
// ============================================================================

SandboxProcess::SandboxProcess(Invocation invocation)
    : invocation_(std::move(invocation)) {}

SandboxProcess::~SandboxProcess() {
    if (state_ == ProcessState::RUNNING) {
        kill_group();
        waitpid(child_pid_, nullptr, 0);
        state_ = ProcessState::FINISHED;
    }
    close_fds();
}

void SandboxProcess::spawn() {
    if (invocation_.argv.empty()) {
        throw SpawnError("empty argument vector");
    }

    // stdin, stdout, stderr, exec status
    int fds[8] = {-1, -1, -1, -1, -1, -1, -1, -1};
    auto close_all = [&fds]() {
        for (int& fd : fds) {
            close_fd(fd);
        }
    };

    for (int i = 0; i < 4; ++i) {
        if (pipe2(&fds[2 * i], O_CLOEXEC) < 0) {
            int err = errno;
            close_all();
            throw SpawnError(std::string("Failed to create pipe: ") + strerror(err));
        }
    }
    int* in_pipe = &fds[0];
    int* out_pipe = &fds[2];
    int* err_pipe = &fds[4];
    int* exec_pipe = &fds[6];

    // Everything the child touches is prepared before fork()
    std::vector<char*> argv;
    for (auto& arg : invocation_.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& var : invocation_.env) {
        envp.push_back(const_cast<char*>(var.c_str()));
    }
    envp.push_back(nullptr);

    const char* cwd = invocation_.working_directory.empty()
        ? nullptr : invocation_.working_directory.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("fork() failed: ") + strerror(err));
    }

    if (pid == 0) {
        // Own process group so a timeout kill reaches any descendants
        setpgid(0, 0);

        if (dup2(in_pipe[0], STDIN_FILENO) < 0 ||
            dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[1], STDERR_FILENO) < 0) {
            child_fail(exec_pipe[1]);
        }
        if (cwd && chdir(cwd) < 0) {
            child_fail(exec_pipe[1]);
        }

        execve(argv[0], argv.data(), envp.data());
        child_fail(exec_pipe[1]);
    }

    setpgid(pid, pid);  // may race with the child's own call; either wins

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    child_pid_ = pid;
    state_ = ProcessState::RUNNING;

    // EOF means execve() succeeded and closed the CLOEXEC write end
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_all();
        waitpid(pid, nullptr, 0);
        state_ = ProcessState::FINISHED;
        spdlog::error("Failed to execute {}: {}", invocation_.argv[0], strerror(child_errno));
        throw SpawnError("cannot execute " + invocation_.argv[0] + ": " + strerror(child_errno));
    }

    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    in_pipe[1] = out_pipe[0] = err_pipe[0] = -1;

    for (int fd : {stdin_fd_, stdout_fd_, stderr_fd_}) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    }
}

void SandboxProcess::pump(RawOutcome& outcome, std::chrono::steady_clock::time_point deadline,
                          bool has_deadline) {
    const std::string& input = invocation_.stdin_payload;
    size_t written = 0;
    if (input.empty()) {
        close_fd(stdin_fd_);
    }

    const size_t limit = invocation_.max_output_bytes;
    char buffer[IO_CHUNK];

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        int poll_timeout = -1;
        if (has_deadline) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                outcome.termination = Termination::TIMED_OUT;
                return;
            }
            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            poll_timeout = static_cast<int>(std::min<int64_t>(remaining.count(), 1000 * 60 * 60));
        }

        struct pollfd pfds[3];
        nfds_t nfds = 0;
        if (stdout_fd_ >= 0) pfds[nfds++] = {stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) pfds[nfds++] = {stderr_fd_, POLLIN, 0};
        if (stdin_fd_ >= 0)  pfds[nfds++] = {stdin_fd_, POLLOUT, 0};

        int ready = poll(pfds, nfds, poll_timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw SpawnError(std::string("poll() failed: ") + strerror(errno));
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            const struct pollfd& p = pfds[i];
            if (p.revents == 0) continue;

            if (p.fd == stdin_fd_) {
                if (p.revents & (POLLERR | POLLHUP)) {
                    // Sandbox stopped reading
                    close_fd(stdin_fd_);
                    continue;
                }
                size_t chunk = std::min(IO_CHUNK, input.size() - written);
                ssize_t n = write(stdin_fd_, input.data() + written, chunk);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) {
                        close_fd(stdin_fd_);
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    if (errno != EPIPE) {
                        spdlog::warn("Writing sandbox stdin failed: {}", strerror(errno));
                    }
                    close_fd(stdin_fd_);
                }
                continue;
            }

            if (p.fd != stdout_fd_ && p.fd != stderr_fd_) {
                continue;  // closed earlier in this round
            }
            bool is_stdout = (p.fd == stdout_fd_);
            int& fd = is_stdout ? stdout_fd_ : stderr_fd_;
            std::string& target = is_stdout ? outcome.stdout_data : outcome.stderr_data;

            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                size_t captured = outcome.stdout_data.size() + outcome.stderr_data.size();
                size_t count = static_cast<size_t>(n);
                if (limit > 0 && captured + count > limit) {
                    target.append(buffer, limit - captured);
                    outcome.termination = Termination::OUTPUT_LIMIT;
                    return;
                }
                target.append(buffer, count);
            } else if (n == 0) {
                close_fd(fd);
            } else if (errno != EAGAIN && errno != EINTR) {
                spdlog::warn("Reading sandbox output failed: {}", strerror(errno));
                close_fd(fd);
            }
        }
    }
}

int SandboxProcess::reap(std::chrono::steady_clock::time_point deadline, bool has_deadline,
                         RawOutcome& outcome) {
    close_fds();

    int status = 0;
    while (true) {
        pid_t result = waitpid(child_pid_, &status, has_deadline ? WNOHANG : 0);
        if (result == child_pid_) {
            break;
        }
        if (result < 0) {
            if (errno == EINTR) continue;
            spdlog::error("waitpid({}) failed: {}", child_pid_, strerror(errno));
            state_ = ProcessState::FINISHED;
            return -1;
        }

        // Output closed but the process lingers
        if (std::chrono::steady_clock::now() >= deadline) {
            outcome.termination = Termination::TIMED_OUT;
            kill_group();
            waitpid(child_pid_, &status, 0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    state_ = ProcessState::FINISHED;
    return decode_wait_status(status);
}

void SandboxProcess::kill_group() {
    if (child_pid_ <= 0) {
        return;
    }
    if (kill(-child_pid_, SIGKILL) < 0) {
        kill(child_pid_, SIGKILL);
    }
}

void SandboxProcess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

RawOutcome SandboxProcess::run() {
    if (state_ != ProcessState::CREATED) {
        throw WasmboxError("sandbox process already used");
    }

    auto start = std::chrono::steady_clock::now();
    bool has_deadline = invocation_.timeout.count() > 0;
    auto deadline = start + invocation_.timeout;

    spawn();
    spdlog::debug("Sandbox started (pid={}, timeout={}ms, stdin={} bytes)",
        child_pid_, invocation_.timeout.count(), invocation_.stdin_payload.size());

    RawOutcome outcome;
    {
        SigpipeGuard guard;
        pump(outcome, deadline, has_deadline);
    }

    if (outcome.termination != Termination::EXITED) {
        kill_group();
    }
    outcome.exit_code = reap(deadline, has_deadline, outcome);
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    switch (outcome.termination) {
        case Termination::TIMED_OUT:
            spdlog::warn("Sandbox pid={} killed after {}ms timeout", child_pid_,
                invocation_.timeout.count());
            break;
        case Termination::OUTPUT_LIMIT:
            spdlog::warn("Sandbox pid={} killed: output exceeded {} bytes", child_pid_,
                invocation_.max_output_bytes);
            break;
        default:
            spdlog::debug("Sandbox pid={} exited (code={}, {}ms)", child_pid_,
                outcome.exit_code, outcome.elapsed.count());
            break;
    }

    return outcome;
}

RawOutcome run(const Invocation& invocation) {
    SandboxProcess process(invocation);
    return process.run();
}

} // namespace wasmbox::runtime
