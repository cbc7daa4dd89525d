#include "runtime/sandbox_process.hpp"
#include "runtime/errors.hpp"
#include "helpers.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include <vector>

using namespace wasmbox::runtime;
using namespace std::chrono_literals;

namespace {

Invocation shell(const std::string& script, std::chrono::milliseconds timeout = 10s) {
    Invocation invocation;
    invocation.argv = {"/bin/sh", "-c", script};
    invocation.env = {"PATH=/usr/bin:/bin"};
    invocation.timeout = timeout;
    invocation.max_output_bytes = 16 * 1024 * 1024;
    return invocation;
}

} // namespace

TEST(SandboxProcess, CapturesStreamsAndExitCode)
{
    RawOutcome outcome = run(shell("echo out; echo err >&2; exit 3"));

    EXPECT_EQ(outcome.termination, Termination::EXITED);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stdout_data, "out\n");
    EXPECT_EQ(outcome.stderr_data, "err\n");
}

TEST(SandboxProcess, FeedsStdin)
{
    Invocation invocation = shell("cat");
    invocation.stdin_payload = "line one\nline two\n";

    RawOutcome outcome = run(invocation);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, invocation.stdin_payload);
}

TEST(SandboxProcess, LargeStdinAndStdoutDoNotDeadlock)
{
    Invocation invocation = shell("cat");
    invocation.stdin_payload.assign(4 * 1024 * 1024, 'x');

    RawOutcome outcome = run(invocation);
    EXPECT_EQ(outcome.termination, Termination::EXITED);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data.size(), invocation.stdin_payload.size());
}

TEST(SandboxProcess, ProcessIgnoringStdin)
{
    Invocation invocation = shell("echo done");
    invocation.stdin_payload.assign(2 * 1024 * 1024, 'y');

    RawOutcome outcome = run(invocation);
    EXPECT_EQ(outcome.termination, Termination::EXITED);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "done\n");
}

TEST(SandboxProcess, Timeout)
{
    auto start = std::chrono::steady_clock::now();
    RawOutcome outcome = run(shell("echo partial; echo warn >&2; sleep 30", 300ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.termination, Termination::TIMED_OUT);
    EXPECT_EQ(outcome.exit_code, 128 + 9);
    EXPECT_EQ(outcome.stdout_data, "partial\n");
    EXPECT_EQ(outcome.stderr_data, "warn\n");
    EXPECT_LT(elapsed, 10s);
}

TEST(SandboxProcess, TimeoutKillsProcessGroup)
{
    // The backgrounded sleep holds stdout open; it must die with the shell
    auto start = std::chrono::steady_clock::now();
    RawOutcome outcome = run(shell("sleep 30 & wait", 200ms));

    EXPECT_EQ(outcome.termination, Termination::TIMED_OUT);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST(SandboxProcess, NoDeadline)
{
    RawOutcome outcome = run(shell("sleep 0.1; echo ok", 0ms));
    EXPECT_EQ(outcome.termination, Termination::EXITED);
    EXPECT_EQ(outcome.stdout_data, "ok\n");
}

TEST(SandboxProcess, OutputLimit)
{
    Invocation invocation = shell("yes");
    invocation.max_output_bytes = 100000;

    RawOutcome outcome = run(invocation);
    EXPECT_EQ(outcome.termination, Termination::OUTPUT_LIMIT);
    EXPECT_EQ(outcome.stdout_data.size() + outcome.stderr_data.size(), 100000u);
    EXPECT_EQ(outcome.exit_code, 128 + 9);
}

TEST(SandboxProcess, KilledBySignal)
{
    RawOutcome outcome = run(shell("kill -9 $$"));
    EXPECT_EQ(outcome.termination, Termination::EXITED);
    EXPECT_EQ(outcome.exit_code, 128 + 9);
}

TEST(SandboxProcess, MissingExecutable)
{
    Invocation invocation;
    invocation.argv = {"/nonexistent/wasmtime", "run"};
    EXPECT_THROW(run(invocation), SpawnError);

    invocation.argv.clear();
    EXPECT_THROW(run(invocation), SpawnError);
}

TEST(SandboxProcess, WorkingDirectory)
{
    wasmbox::test::TempDir dir;
    Invocation invocation = shell("pwd -P");
    invocation.working_directory = dir.path().string();

    RawOutcome outcome = run(invocation);
    std::string expected = std::filesystem::canonical(dir.path()).string() + "\n";
    EXPECT_EQ(outcome.stdout_data, expected);
}

TEST(SandboxProcess, EnvironmentIsExplicit)
{
    wasmbox::test::ScopedEnv secret("WASMBOX_TEST_SECRET", "hunter2");
    RawOutcome outcome = run(shell("echo \"[$WASMBOX_TEST_SECRET]\""));
    EXPECT_EQ(outcome.stdout_data, "[]\n");
}

TEST(SandboxProcess, SingleUse)
{
    SandboxProcess process(shell("true"));
    EXPECT_EQ(process.state(), ProcessState::CREATED);

    process.run();
    EXPECT_EQ(process.state(), ProcessState::FINISHED);
    EXPECT_THROW(process.run(), WasmboxError);
}

TEST(SandboxProcess, ConcurrentRunsAreIsolated)
{
    constexpr int THREADS = 8;
    std::vector<RawOutcome> outcomes(THREADS);
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([i, &outcomes]() {
            Invocation invocation = shell("cat; echo " + std::to_string(i) + " >&2");
            invocation.stdin_payload = "payload-" + std::to_string(i);
            outcomes[i] = run(invocation);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < THREADS; ++i) {
        EXPECT_EQ(outcomes[i].stdout_data, "payload-" + std::to_string(i));
        EXPECT_EQ(outcomes[i].stderr_data, std::to_string(i) + "\n");
        EXPECT_EQ(outcomes[i].exit_code, 0);
    }
}
