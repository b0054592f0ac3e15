#include <gtest/gtest.h>
#include "sandbox.h"
#include "file_utils.h"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace runcage {
namespace {

class SandboxRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_root = std::filesystem::temp_directory_path() /
                    ("runcage_sandbox_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(work_root);

        config.interpreter = "sh";
        config.work_root = work_root.string();
        config.use_cgroups = false;
        sandbox = std::make_unique<Sandbox>(config);
    }

    void TearDown() override {
        std::filesystem::remove_all(work_root);
    }

    SandboxRequest request_for(const std::string& script,
                               std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        SandboxRequest request;
        request.job_id = "sandbox-test-" + std::to_string(next_id++);
        request.script = script;
        request.format = OutputFormat::TABULAR;
        request.profile.wall_clock_timeout = timeout;
        // RLIMIT_NPROC counts every process of our uid
        request.profile.max_processes = 4096;
        return request;
    }

    ExitOutcome run(const SandboxRequest& request) {
        auto handle = sandbox->start(request);
        CancelToken never;
        ExitOutcome outcome = sandbox->wait(*handle, Clock::now() + request.profile.wall_clock_timeout, never);
        sandbox->destroy(*handle);
        return outcome;
    }

    // A file outside every workspace that scripts must never be able to read
    std::string host_secret() const {
        std::filesystem::path secret = work_root / "host_secret.txt";
        FileUtils::write_file(secret.string(), "host-only\n", std::filesystem::perms::owner_read |
                                                               std::filesystem::perms::owner_write);
        return secret.string();
    }

    size_t leftover_entries() const {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(work_root)) {
            (void)entry;
            count++;
        }
        return count;
    }

    std::filesystem::path work_root;
    SandboxConfig config;
    std::unique_ptr<Sandbox> sandbox;
    int next_id = 0;
};

// ============================================================================
// Exit and Output Capture
// ============================================================================

TEST_F(SandboxRunnerTest, CapturesStdoutAndExitCode) {
    ExitOutcome outcome = run(request_for("echo 'a,b'\necho '1,2'\n"));

    EXPECT_EQ(outcome.kind, ExitKind::EXITED);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "a,b\n1,2\n");
    EXPECT_FALSE(outcome.stdout_truncated);
}

TEST_F(SandboxRunnerTest, NonZeroExitWithStderr) {
    ExitOutcome outcome = run(request_for("echo 'broken' >&2\nexit 3\n"));

    EXPECT_EQ(outcome.kind, ExitKind::EXITED);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_NE(outcome.stderr_data.find("broken"), std::string::npos) << outcome.stderr_data;
}

TEST_F(SandboxRunnerTest, KilledBySignal) {
    ExitOutcome outcome = run(request_for("kill -9 $$\n"));

    EXPECT_EQ(outcome.kind, ExitKind::SIGNALED);
    EXPECT_EQ(outcome.signal, SIGKILL);
}

TEST_F(SandboxRunnerTest, StdoutTruncatedAtCeiling) {
    SandboxRequest request = request_for("i=0\nwhile [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done\n");
    request.profile.max_output_bytes = 1000;

    ExitOutcome outcome = run(request);

    EXPECT_EQ(outcome.stdout_data.size(), 1000u);
    EXPECT_TRUE(outcome.stdout_truncated);
}

TEST_F(SandboxRunnerTest, CollectsDeclaredOutputFile) {
    ExitOutcome outcome = run(request_for("printf 'x,y\\n1,2\\n' > \"$OUTPUT_FILE\"\necho 'extra' > notes.txt\n"));

    ASSERT_EQ(outcome.files.count("output.csv"), 1u);
    EXPECT_EQ(outcome.files.at("output.csv").data, "x,y\n1,2\n");
    ASSERT_EQ(outcome.files.count("notes.txt"), 1u);
    EXPECT_EQ(outcome.files.count("script.sh"), 0u) << "The script itself is not an artifact";
}

TEST_F(SandboxRunnerTest, OutputFileOverCeilingIsMarkedTruncated) {
    // Given: a script writing 5000 bytes into its output file with a 1000 byte ceiling
    SandboxRequest request = request_for("head -c 5000 /dev/zero | tr '\\0' a > \"$OUTPUT_FILE\"\n");
    request.profile.max_output_bytes = 1000;

    // When
    ExitOutcome outcome = run(request);

    // Then: the ceiling-sized prefix is kept and flagged as truncated
    ASSERT_EQ(outcome.files.count("output.csv"), 1u);
    const FileContent& file = outcome.files.at("output.csv");
    EXPECT_EQ(file.data, std::string(1000, 'a'));
    EXPECT_TRUE(file.truncated);
}

TEST_F(SandboxRunnerTest, SymlinkedOutputFileIsNotFollowed) {
    std::string secret = host_secret();
    ExitOutcome outcome = run(request_for("ln -sf " + secret + " output.csv\n"
                                          "ln -sf " + secret + " notes.txt\n"));

    EXPECT_EQ(outcome.kind, ExitKind::EXITED);
    EXPECT_EQ(outcome.files.count("output.csv"), 0u);
    EXPECT_EQ(outcome.files.count("notes.txt"), 0u);
}

TEST_F(SandboxRunnerTest, BackgroundChildCannotPlantSymlinkAfterExit) {
    // Given: a child that keeps swapping output.csv for a link to a host file
    // after the main script has exited
    std::string secret = host_secret();
    std::string script = "( while :; do ln -sf " + secret + " output.csv; done ) &\n"
                         "sleep 0.2\n"
                         "echo 'a,b'\n";

    // When
    ExitOutcome outcome = run(request_for(script));

    // Then: nothing collected carries the host file
    EXPECT_EQ(outcome.kind, ExitKind::EXITED);
    EXPECT_EQ(outcome.files.count("output.csv"), 0u);
    for (const auto& entry : outcome.files) {
        EXPECT_EQ(entry.second.data.find("host-only"), std::string::npos)
            << entry.first << " leaked a host file";
    }
    EXPECT_EQ(outcome.stdout_data, "a,b\n");
}

TEST_F(SandboxRunnerTest, CleanEnvironment) {
    SandboxRequest request = request_for("echo \"$OUTPUT_FORMAT|$OUTPUT_FILE|$TARGET_URL|$RUNCAGE_LEAK\"\n");
    request.target_url = "https://example.com/data";
    setenv("RUNCAGE_LEAK", "host-secret", 1);

    ExitOutcome outcome = run(request);
    unsetenv("RUNCAGE_LEAK");

    EXPECT_EQ(outcome.stdout_data, "csv|output.csv|https://example.com/data|\n");
}

TEST_F(SandboxRunnerTest, UsageIsMeasured) {
    ExitOutcome outcome = run(request_for("i=0\nwhile [ $i -lt 20000 ]; do i=$((i+1)); done\n"));

    EXPECT_EQ(outcome.kind, ExitKind::EXITED);
    EXPECT_GT(outcome.usage.peak_memory_bytes, 0u);
    EXPECT_GE(outcome.usage.cpu_seconds, 0.0);
    EXPECT_GT(outcome.wall_time.count(), 0);
}

// ============================================================================
// Deadline, Cancellation and Teardown
// ============================================================================

TEST_F(SandboxRunnerTest, DeadlineKillsSleepingScript) {
    SandboxRequest request = request_for("sleep 30\n");
    auto handle = sandbox->start(request);
    CancelToken never;

    auto begin = Clock::now();
    ExitOutcome outcome = sandbox->wait(*handle, begin + std::chrono::milliseconds(500), never);
    auto elapsed = Clock::now() - begin;
    sandbox->destroy(*handle);

    EXPECT_EQ(outcome.kind, ExitKind::DEADLINE_EXCEEDED);
    EXPECT_GE(elapsed, std::chrono::milliseconds(500));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(SandboxRunnerTest, CancelTokenStopsScript) {
    SandboxRequest request = request_for("sleep 30\n");
    auto handle = sandbox->start(request);
    CancelToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto begin = Clock::now();
    ExitOutcome outcome = sandbox->wait(*handle, begin + std::chrono::seconds(30), token);
    auto elapsed = Clock::now() - begin;
    canceller.join();
    sandbox->destroy(*handle);

    EXPECT_EQ(outcome.kind, ExitKind::CANCELLED);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(SandboxRunnerTest, DestroyRemovesWorkspaceAndIsIdempotent) {
    SandboxRequest request = request_for("sleep 30 &\nsleep 30\n");
    auto handle = sandbox->start(request);
    EXPECT_TRUE(handle->alive);
    EXPECT_GT(leftover_entries(), 0u);

    sandbox->destroy(*handle);
    sandbox->destroy(*handle);

    EXPECT_FALSE(handle->alive);
    EXPECT_TRUE(handle->destroyed);
    EXPECT_EQ(leftover_entries(), 0u) << "Working directory removed with the sandbox";
}

TEST_F(SandboxRunnerTest, MissingInterpreterIsUnavailable) {
    config.interpreter = "runcage-no-such-interpreter";
    Sandbox broken(config);

    EXPECT_THROW(broken.start(request_for("echo hi\n")), SandboxUnavailableError);
    EXPECT_EQ(leftover_entries(), 0u);
}

TEST(SandboxScriptNameTest, ExtensionFollowsInterpreter) {
    EXPECT_EQ(Sandbox::script_filename("python3"), "script.py");
    EXPECT_EQ(Sandbox::script_filename("/usr/bin/python3.11"), "script.py");
    EXPECT_EQ(Sandbox::script_filename("sh"), "script.sh");
    EXPECT_EQ(Sandbox::script_filename("node"), "script.js");
    EXPECT_EQ(Sandbox::script_filename("lua"), "script");
}

} // namespace
} // namespace runcage
