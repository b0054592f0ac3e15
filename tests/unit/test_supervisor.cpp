#include <gtest/gtest.h>
#include "supervisor.h"
#include "fake_runner.h"
#include <csignal>
#include <thread>
#include <vector>
#include <utility>

namespace runcage {
namespace {

class SupervisorTest : public ::testing::Test {
protected:
    ExecutionJob make_job(const std::string& id,
                          std::chrono::milliseconds timeout = std::chrono::seconds(5),
                          OutputFormat format = OutputFormat::TABULAR) {
        ExecutionJob job;
        job.id = id;
        job.tenant_id = "tenant-a";
        job.script = "print('hello')";
        job.format = format;
        job.profile.wall_clock_timeout = timeout;
        return job;
    }

    TransitionObserver recorder() {
        return [this](JobState from, JobState to, ExecutionResult*) {
            transitions.emplace_back(from, to);
        };
    }

    std::vector<JobState> visited() const {
        std::vector<JobState> states;
        for (const auto& t : transitions) {
            states.push_back(t.second);
        }
        return states;
    }

    FakeRunner runner;
    CancelToken cancel;
    std::vector<std::pair<JobState, JobState>> transitions;
};

// ============================================================================
// Normal completion
// ============================================================================

TEST_F(SupervisorTest, SuccessWalksEveryStateInOrder) {
    // Given: a script that prints three CSV rows and exits zero
    runner.script_outcome("job-1", FakeRunner::success_outcome(
        "name,price,qty\nwidget,1.50,3\ngadget,2.00,1\ngizmo,9.99,7\n"));
    Supervisor supervisor(runner, recorder());

    // When: the job runs to completion
    ExecutionResult result = supervisor.run(make_job("job-1"), cancel);

    // Then: it is a Success with exactly three rows in source field order
    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result)) << describe(result);
    const auto& output = std::get<SuccessResult>(result).output;
    const auto& table = std::get<TabularOutput>(output.data);
    EXPECT_EQ(table.columns, (std::vector<std::string>{"name", "price", "qty"}));
    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_EQ(table.rows[2], (std::vector<std::string>{"gizmo", "9.99", "7"}));

    // And: states were visited strictly in order
    EXPECT_EQ(visited(), (std::vector<JobState>{
        JobState::STARTING, JobState::RUNNING, JobState::COLLECTING, JobState::TERMINAL}));
    EXPECT_EQ(supervisor.state(), JobState::TERMINAL);

    // And: the sandbox was destroyed exactly once
    EXPECT_EQ(runner.start_calls(), 1);
    EXPECT_EQ(runner.destroy_count("job-1"), 1);
}

TEST_F(SupervisorTest, SuccessKeepsCpuUsage) {
    ExitOutcome outcome = FakeRunner::success_outcome("a,b\n1,2\n");
    outcome.usage.cpu_seconds = 1.25;
    outcome.usage.peak_memory_bytes = 4096;
    runner.script_outcome("job-usage", outcome);
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-usage"), cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result));
    EXPECT_DOUBLE_EQ(std::get<SuccessResult>(result).usage.cpu_seconds, 1.25);
    EXPECT_EQ(std::get<SuccessResult>(result).usage.peak_memory_bytes, 4096u);
}

// ============================================================================
// Degraded and failed outcomes
// ============================================================================

TEST_F(SupervisorTest, NonZeroExitIsScriptError) {
    runner.script_outcome("job-2", FakeRunner::exit_outcome(3, "Traceback: boom\n"));
    Supervisor supervisor(runner, recorder());

    ExecutionResult result = supervisor.run(make_job("job-2"), cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result)) << describe(result);
    const auto& failure = std::get<FailureResult>(result);
    EXPECT_EQ(failure.kind, FailureKind::SCRIPT_ERROR);
    ASSERT_TRUE(failure.exit_code.has_value());
    EXPECT_EQ(*failure.exit_code, 3);
    EXPECT_NE(failure.diagnostics.find("boom"), std::string::npos);
    EXPECT_EQ(runner.destroy_count("job-2"), 1);
}

TEST_F(SupervisorTest, NonZeroExitWithValidOutputIsStillFailure) {
    ExitOutcome outcome = FakeRunner::success_outcome("a,b\n1,2\n");
    outcome.exit_code = 1;
    runner.script_outcome("job-3", outcome);
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-3"), cancel);

    EXPECT_TRUE(std::holds_alternative<FailureResult>(result));
}

TEST_F(SupervisorTest, MalformedOutputIsPartialNeverFailure) {
    runner.script_outcome("job-4", FakeRunner::success_outcome("a,b\n1,2,3\n"));
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-4"), cancel);

    ASSERT_TRUE(std::holds_alternative<PartialOutputResult>(result)) << describe(result);
    const auto& partial = std::get<PartialOutputResult>(result);
    EXPECT_EQ(partial.reason, CollectionErrorKind::UNPARSEABLE);
    EXPECT_EQ(partial.output, "a,b\n1,2,3\n");
}

TEST_F(SupervisorTest, EmptyOutputIsPartialEmpty) {
    runner.script_outcome("job-5", FakeRunner::success_outcome(""));
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-5"), cancel);

    ASSERT_TRUE(std::holds_alternative<PartialOutputResult>(result));
    EXPECT_EQ(std::get<PartialOutputResult>(result).reason, CollectionErrorKind::EMPTY);
}

TEST_F(SupervisorTest, TruncatedOutputIsPartialTruncated) {
    ExitOutcome outcome = FakeRunner::success_outcome("a,b\n1,2\n");
    outcome.stdout_truncated = true;
    runner.script_outcome("job-6", outcome);
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-6"), cancel);

    ASSERT_TRUE(std::holds_alternative<PartialOutputResult>(result));
    EXPECT_EQ(std::get<PartialOutputResult>(result).reason, CollectionErrorKind::TRUNCATED);
}

TEST_F(SupervisorTest, OutputFileOverCeilingIsPartialTruncated) {
    // Given: the writer was killed by SIGXFSZ after filling output.csv past the ceiling
    ExitOutcome outcome;
    outcome.kind = ExitKind::SIGNALED;
    outcome.signal = SIGXFSZ;
    outcome.limit_exceeded = "file size";
    FileContent file;
    file.data = "a,b\n1,2\n";
    file.size_bytes = 9;
    file.truncated = true;
    outcome.files["output.csv"] = file;
    runner.script_outcome("job-fsz", outcome);
    Supervisor supervisor(runner, nullptr);

    // When
    ExecutionResult result = supervisor.run(make_job("job-fsz"), cancel);

    // Then: reported like oversized stdout, with the prefix kept
    ASSERT_TRUE(std::holds_alternative<PartialOutputResult>(result)) << describe(result);
    const auto& partial = std::get<PartialOutputResult>(result);
    EXPECT_EQ(partial.reason, CollectionErrorKind::TRUNCATED);
    EXPECT_EQ(partial.output, "a,b\n1,2\n");
}

TEST_F(SupervisorTest, ShellExitAfterOutputFileOverflowIsPartialTruncated) {
    // A shell reports its killed writer as status 128 + SIGXFSZ
    ExitOutcome outcome = FakeRunner::exit_outcome(128 + SIGXFSZ, "");
    FileContent file;
    file.data = "a,b\n";
    file.size_bytes = 4;
    file.truncated = true;
    outcome.files["output.csv"] = file;
    runner.script_outcome("job-sh", outcome);
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-sh"), cancel);

    ASSERT_TRUE(std::holds_alternative<PartialOutputResult>(result)) << describe(result);
    EXPECT_EQ(std::get<PartialOutputResult>(result).reason, CollectionErrorKind::TRUNCATED);
}

TEST_F(SupervisorTest, SignalWithoutOutputOverflowStaysFailure) {
    // An overflowing file that is not the declared output does not change the verdict
    ExitOutcome outcome;
    outcome.kind = ExitKind::SIGNALED;
    outcome.signal = SIGXFSZ;
    FileContent file;
    file.data = "junk";
    file.truncated = true;
    outcome.files["scratch.bin"] = file;
    runner.script_outcome("job-other", outcome);
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-other"), cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result)) << describe(result);
    EXPECT_EQ(std::get<FailureResult>(result).kind, FailureKind::SCRIPT_ERROR);
}

TEST_F(SupervisorTest, KilledByLimitReportsSignalAndLimit) {
    ExitOutcome outcome;
    outcome.kind = ExitKind::SIGNALED;
    outcome.signal = SIGKILL;
    outcome.limit_exceeded = "memory";
    runner.script_outcome("job-7", outcome);
    Supervisor supervisor(runner, nullptr);

    ExecutionResult result = supervisor.run(make_job("job-7"), cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    const auto& failure = std::get<FailureResult>(result);
    EXPECT_EQ(failure.kind, FailureKind::SCRIPT_ERROR);
    EXPECT_EQ(*failure.exit_code, 128 + SIGKILL);
    EXPECT_NE(failure.message.find("memory limit exceeded"), std::string::npos) << failure.message;
}

TEST_F(SupervisorTest, SandboxUnavailableSkipsRunning) {
    // Given: a runner that cannot create sandboxes
    runner.fail_start(true);
    Supervisor supervisor(runner, recorder());

    // When: the job runs
    ExecutionResult result = supervisor.run(make_job("job-8"), cancel);

    // Then: Starting goes straight to Terminal with SandboxUnavailable
    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    EXPECT_EQ(std::get<FailureResult>(result).kind, FailureKind::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(visited(), (std::vector<JobState>{JobState::STARTING, JobState::TERMINAL}));

    // And: nothing was issued, so nothing to destroy
    EXPECT_EQ(runner.destroy_calls(), 0);
    EXPECT_EQ(runner.running(), 0);
}

// ============================================================================
// Timeout
// ============================================================================

TEST_F(SupervisorTest, DeadlineProducesTimedOutWithoutCollecting) {
    // Given: a script that never finishes and a 50ms timeout
    runner.hold_waits(true);
    Supervisor supervisor(runner, recorder());

    // When: the job runs
    auto begin = Clock::now();
    ExecutionResult result = supervisor.run(make_job("job-9", std::chrono::milliseconds(50)), cancel);
    auto elapsed = Clock::now() - begin;

    // Then: TimedOut, measured from Starting, within the enforcement slack
    ASSERT_TRUE(std::holds_alternative<TimedOutResult>(result)) << describe(result);
    EXPECT_GE(std::get<TimedOutResult>(result).duration.count(), 50);
    EXPECT_LT(elapsed, std::chrono::milliseconds(50 + ENFORCEMENT_SLACK_MS));

    // And: Running went to Terminal directly and the sandbox was destroyed once
    EXPECT_EQ(visited(), (std::vector<JobState>{
        JobState::STARTING, JobState::RUNNING, JobState::TERMINAL}));
    EXPECT_EQ(runner.destroy_count("job-9"), 1);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(SupervisorTest, CancelledBeforeStartNeverCreatesSandbox) {
    cancel.cancel();
    Supervisor supervisor(runner, recorder());

    ExecutionResult result = supervisor.run(make_job("job-10"), cancel);

    EXPECT_TRUE(std::holds_alternative<CancelledResult>(result));
    EXPECT_EQ(runner.start_calls(), 0);
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0].first, JobState::QUEUED);
    EXPECT_EQ(transitions[0].second, JobState::TERMINAL);
}

TEST_F(SupervisorTest, CancelWhileRunningDestroysSandbox) {
    // Given: a job blocked in Running
    runner.hold_waits(true);
    Supervisor supervisor(runner, recorder());

    std::thread canceller([this, &supervisor] {
        while (supervisor.state() != JobState::RUNNING) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        cancel.cancel();
    });

    // When: it is cancelled
    ExecutionResult result = supervisor.run(make_job("job-11"), cancel);
    canceller.join();

    // Then: Cancelled, no Collecting, sandbox destroyed once
    EXPECT_TRUE(std::holds_alternative<CancelledResult>(result)) << describe(result);
    EXPECT_EQ(visited(), (std::vector<JobState>{
        JobState::STARTING, JobState::RUNNING, JobState::TERMINAL}));
    EXPECT_EQ(runner.destroy_count("job-11"), 1);
}

// ============================================================================
// Engine faults
// ============================================================================

TEST_F(SupervisorTest, ObserverFaultBecomesInternalErrorAndStillDestroys) {
    // Given: an observer that throws when the job enters Running
    Supervisor supervisor(runner, [](JobState, JobState to, ExecutionResult*) {
        if (to == JobState::RUNNING) {
            throw std::runtime_error("event bus down");
        }
    });

    // When: the job runs
    ExecutionResult result = supervisor.run(make_job("job-12"), cancel);

    // Then: the job still terminates, as an internal error, with its sandbox gone
    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    EXPECT_EQ(std::get<FailureResult>(result).kind, FailureKind::INTERNAL_ERROR);
    EXPECT_EQ(supervisor.state(), JobState::TERMINAL);
    EXPECT_EQ(runner.destroy_count("job-12"), 1);
}

TEST_F(SupervisorTest, TerminalObserverMayReplaceResult) {
    Supervisor supervisor(runner, [](JobState, JobState to, ExecutionResult* result) {
        if (to == JobState::TERMINAL) {
            ASSERT_NE(result, nullptr);
            *result = CancelledResult{};
        }
    });

    ExecutionResult result = supervisor.run(make_job("job-13"), cancel);

    EXPECT_TRUE(std::holds_alternative<CancelledResult>(result));
}

TEST_F(SupervisorTest, RequestCarriesJobSettings) {
    ExecutionJob job = make_job("job-14", std::chrono::seconds(7), OutputFormat::DOCUMENT);
    job.target_url = "https://example.com";
    job.network_access = true;
    runner.script_outcome("job-14", FakeRunner::success_outcome("{\"a\": 1}"));
    Supervisor supervisor(runner, nullptr);

    supervisor.run(job, cancel);

    auto requests = runner.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].format, OutputFormat::DOCUMENT);
    EXPECT_EQ(requests[0].target_url.value_or(""), "https://example.com");
    EXPECT_TRUE(requests[0].network_access);
    EXPECT_EQ(requests[0].profile.wall_clock_timeout, std::chrono::seconds(7));
}

} // namespace
} // namespace runcage
