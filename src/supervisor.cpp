#include "supervisor.h"
#include "output_collector.h"
#include <iostream>
#include <cstring>
#include <csignal>

namespace runcage {

namespace {

// Destroys the sandbox on scope exit unless destroy_now() already did.
// Guarantees exactly one destroy() per handle on every path out of drive().
class SandboxGuard {
public:
    SandboxGuard(SandboxRunner& runner, SandboxHandle& handle)
        : runner_(runner), handle_(handle) {}

    ~SandboxGuard() {
        if (!done_) {
            runner_.destroy(handle_);
        }
    }

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

    void destroy_now() {
        if (!done_) {
            done_ = true;
            runner_.destroy(handle_);
        }
    }

private:
    SandboxRunner& runner_;
    SandboxHandle& handle_;
    bool done_ = false;
};

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string limit_suffix(const ExitOutcome& outcome) {
    return outcome.limit_exceeded.empty() ? "" : " (" + outcome.limit_exceeded + " limit exceeded)";
}

std::string diagnostics(const ExitOutcome& outcome) {
    return outcome.stderr_truncated ? outcome.stderr_data + "\n[stderr truncated]"
                                    : outcome.stderr_data;
}

} // namespace

Supervisor::Supervisor(SandboxRunner& runner, TransitionObserver observer)
    : runner_(runner), observer_(std::move(observer)) {}

ExecutionResult Supervisor::run(const ExecutionJob& job, const CancelToken& cancel) {
    ExecutionResult result = CancelledResult{};
    try {
        result = drive(job, cancel);
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Job " << job.id << " internal error: " << e.what() << std::endl;
        result = FailureResult{FailureKind::INTERNAL_ERROR, e.what(), std::nullopt, ""};
    }

    // Cancellation requested at any point before Terminal wins
    if (cancel.is_cancelled()) {
        result = CancelledResult{};
    }

    try {
        transition(job.id, JobState::TERMINAL, &result);
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Job " << job.id << " terminal observer failed: "
                  << e.what() << std::endl;
    }

    std::cout << "[Supervisor] Job " << job.id << " finished: " << describe(result) << std::endl;
    return result;
}

ExecutionResult Supervisor::drive(const ExecutionJob& job, const CancelToken& cancel) {
    // Cancelled between dequeue and start: no sandbox at all
    if (cancel.is_cancelled()) {
        return CancelledResult{};
    }

    transition(job.id, JobState::STARTING);
    starting_at_ = Clock::now();
    auto deadline = starting_at_ + job.profile.wall_clock_timeout;

    SandboxRequest request;
    request.job_id = job.id;
    request.script = job.script;
    request.format = job.format;
    request.target_url = job.target_url;
    request.profile = job.profile;
    request.network_access = job.network_access;

    std::unique_ptr<SandboxHandle> handle;
    try {
        handle = runner_.start(request);
    } catch (const SandboxUnavailableError& e) {
        std::cerr << "[Supervisor] Job " << job.id << ": " << e.what() << std::endl;
        return FailureResult{FailureKind::SANDBOX_UNAVAILABLE, e.what(), std::nullopt, ""};
    }

    SandboxGuard guard(runner_, *handle);
    transition(job.id, JobState::RUNNING);

    ExitOutcome outcome = runner_.wait(*handle, deadline, cancel);

    switch (outcome.kind) {
        case ExitKind::CANCELLED:
            guard.destroy_now();
            return CancelledResult{};
        case ExitKind::DEADLINE_EXCEEDED:
            // Partial output is never trusted after a timeout
            guard.destroy_now();
            return TimedOutResult{elapsed_since(starting_at_)};
        case ExitKind::EXITED:
        case ExitKind::SIGNALED:
            break;
    }

    transition(job.id, JobState::COLLECTING);
    guard.destroy_now();

    return interpret(outcome, job.format, job.profile.max_output_bytes);
}

ExecutionResult Supervisor::interpret(const ExitOutcome& outcome,
                                      OutputFormat format,
                                      size_t max_output_bytes) {
    // The file size limit sits one byte past the ceiling, so an overflowing
    // output file is always marked truncated. Whatever the writer did after
    // EFBIG or SIGXFSZ, the run is reported like oversized stdout.
    auto artifact = outcome.files.find(OutputCollector::output_filename(format));
    bool output_overflowed = artifact != outcome.files.end() && artifact->second.truncated;

    if (outcome.kind == ExitKind::SIGNALED && !output_overflowed) {
        const char* name = strsignal(outcome.signal);
        return FailureResult{
            FailureKind::SCRIPT_ERROR,
            "Script killed by signal " + std::to_string(outcome.signal) +
                (name ? std::string(" (") + name + ")" : std::string()) + limit_suffix(outcome),
            128 + outcome.signal,
            diagnostics(outcome),
            outcome.usage};
    }

    if (outcome.kind == ExitKind::EXITED && outcome.exit_code != 0 && !output_overflowed) {
        return FailureResult{
            FailureKind::SCRIPT_ERROR,
            "Script exited with status " + std::to_string(outcome.exit_code) + limit_suffix(outcome),
            outcome.exit_code,
            diagnostics(outcome),
            outcome.usage};
    }

    OutputCollector collector(max_output_bytes);
    CollectionResult collected = collector.collect(outcome.raw_output(), format);

    if (auto* output = std::get_if<CollectedOutput>(&collected)) {
        return SuccessResult{std::move(*output), outcome.wall_time, outcome.usage};
    }

    auto& error = std::get<CollectionError>(collected);
    return PartialOutputResult{error.raw, error.kind, error.message, outcome.wall_time, outcome.usage};
}

void Supervisor::transition(const std::string& job_id, JobState to, ExecutionResult* result) {
    JobState from = state_.load();
    if (!is_forward_transition(from, to)) {
        throw std::logic_error("Illegal transition " + to_string(from) + " -> " + to_string(to) +
                               " for job " + job_id);
    }
    state_.store(to);

    std::cout << "[Supervisor] Job " << job_id << ": " << to_string(from)
              << " -> " << to_string(to) << std::endl;

    if (observer_) {
        observer_(from, to, result);
    }
}

} // namespace runcage
