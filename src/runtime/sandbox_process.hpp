/**
 * Wasmbox Sandbox Process
 *
 * One wasmtime subprocess per invocation: spawn, feed stdin, capture
 * stdout/stderr, enforce the deadline and output cap, reap. Instances are
 * single-use and never pooled; each call gets a fresh isolated process.
 */
#pragma once
#include <string>
#include <chrono>
#include <sys/types.h>
#include "runtime/invocation.hpp"

namespace wasmbox::runtime {

// How the run ended, as seen by the driver
enum class Termination {
    EXITED,         // process exited or died on its own
    TIMED_OUT,      // killed at the deadline
    OUTPUT_LIMIT    // killed after exceeding max_output_bytes
};

const char* termination_to_string(Termination termination);

struct RawOutcome {
    Termination termination = Termination::EXITED;
    int exit_code = -1;          // 128 + signal if terminated by a signal
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::milliseconds elapsed{0};
};

enum class ProcessState {
    CREATED,
    RUNNING,
    FINISHED
};

class SandboxProcess {
public:
    explicit SandboxProcess(Invocation invocation);
    ~SandboxProcess();

    // Non-copyable
    SandboxProcess(const SandboxProcess&) = delete;
    SandboxProcess& operator=(const SandboxProcess&) = delete;

    // Blocks until exit, timeout or output overflow. Throws SpawnError when
    // the process cannot be started; may only be called once.
    RawOutcome run();

    ProcessState state() const { return state_; }
    pid_t pid() const { return child_pid_; }

private:
    Invocation invocation_;
    ProcessState state_ = ProcessState::CREATED;
    pid_t child_pid_ = -1;

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    void spawn();
    void pump(RawOutcome& outcome, std::chrono::steady_clock::time_point deadline, bool has_deadline);
    int reap(std::chrono::steady_clock::time_point deadline, bool has_deadline, RawOutcome& outcome);
    void kill_group();
    void close_fds();
};

// Run invocation in a fresh SandboxProcess
RawOutcome run(const Invocation& invocation);

} // namespace wasmbox::runtime
