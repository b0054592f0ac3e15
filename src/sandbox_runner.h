#pragma once

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <stdexcept>
#include "types.h"
#include "file_utils.h"
#include "cancel_token.h"
#include "execution_result.h"
#include "output_collector.h"

namespace runcage {

// Host could not create an isolated environment
class SandboxUnavailableError : public std::runtime_error {
public:
    explicit SandboxUnavailableError(const std::string& message)
        : std::runtime_error("Sandbox unavailable: " + message) {}
};

// Everything a runner needs to start one sandbox
struct SandboxRequest {
    std::string job_id;
    std::string script;
    OutputFormat format = OutputFormat::TABULAR;
    std::optional<std::string> target_url;
    ResourceProfile profile;
    bool network_access = false;
};

// Whether a job may reach the network under `policy`
bool egress_allowed(NetworkPolicy policy, const std::optional<std::string>& target_url);

// Ownership record for one isolated environment. Runners derive from it to
// keep their own process state; the Supervisor only sees this part.
struct SandboxHandle {
    std::string id;                 // Process or container identifier
    ResourceProfile limits;
    Clock::time_point started_at;
    bool alive = false;             // Process started and not yet reaped
    bool destroyed = false;

    virtual ~SandboxHandle() = default;
};

enum class ExitKind {
    EXITED,              // Process exited on its own
    SIGNALED,            // Process was killed by a signal (limits included)
    DEADLINE_EXCEEDED,   // Deadline passed first
    CANCELLED            // Cancel token fired first
};

std::string to_string(ExitKind kind);

struct ExitOutcome {
    ExitKind kind = ExitKind::EXITED;
    int exit_code = 0;
    int signal = 0;

    std::string stdout_data;
    bool stdout_truncated = false;
    std::string stderr_data;
    bool stderr_truncated = false;
    std::map<std::string, FileContent> files;   // Working directory artifacts

    std::chrono::milliseconds wall_time{0};
    UsageStats usage;
    std::string limit_exceeded;     // "memory", "cpu time", "file size" when detected

    // View consumed by the Output Collector
    RawOutput raw_output() const;
};

// start/wait/destroy contract the Supervisor drives. Implementations must
// guarantee that destroy() is idempotent and safe on any handle they issued.
class SandboxRunner {
public:
    virtual ~SandboxRunner() = default;

    // Create the environment and hand the script off.
    // Throws SandboxUnavailableError; nothing is left behind in that case.
    virtual std::unique_ptr<SandboxHandle> start(const SandboxRequest& request) = 0;

    // Block until the process exits, the deadline passes, or `cancel` fires,
    // whichever comes first.
    virtual ExitOutcome wait(SandboxHandle& handle,
                             Clock::time_point deadline,
                             const CancelToken& cancel) = 0;

    // Kill everything in the sandbox and release its resources
    virtual void destroy(SandboxHandle& handle) noexcept = 0;
};

} // namespace runcage
