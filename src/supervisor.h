#pragma once

#include <string>
#include <atomic>
#include <functional>
#include "types.h"
#include "execution_job.h"
#include "execution_result.h"
#include "sandbox_runner.h"
#include "cancel_token.h"

namespace runcage {

// Called on every state change of the supervised job. `result` is non-null
// only on the transition into TERMINAL; the observer may replace it with
// CancelledResult when a cancellation raced the final transition.
using TransitionObserver =
    std::function<void(JobState from, JobState to, ExecutionResult* result)>;

// Owns one job from Starting to Terminal: drives the runner, applies the
// deadline, turns exit status plus collected output into the terminal result.
// One instance per job; not reusable.
class Supervisor {
public:
    Supervisor(SandboxRunner& runner, TransitionObserver observer);

    // Run the job to its terminal state. Never throws: engine faults become
    // Failure{InternalError}.
    ExecutionResult run(const ExecutionJob& job, const CancelToken& cancel);

    JobState state() const { return state_.load(); }

    // Combine an exit outcome with the collector's verdict (exposed for tests)
    static ExecutionResult interpret(const ExitOutcome& outcome,
                                     OutputFormat format,
                                     size_t max_output_bytes);

private:
    ExecutionResult drive(const ExecutionJob& job, const CancelToken& cancel);
    void transition(const std::string& job_id, JobState to, ExecutionResult* result = nullptr);

    SandboxRunner& runner_;
    TransitionObserver observer_;
    std::atomic<JobState> state_{JobState::QUEUED};
    Clock::time_point starting_at_;
};

} // namespace runcage
