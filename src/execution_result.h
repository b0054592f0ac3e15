#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <variant>
#include <json/json.h>
#include "types.h"
#include "output_collector.h"

namespace runcage {

enum class FailureKind {
    SANDBOX_UNAVAILABLE,   // Host could not create an isolated environment
    SCRIPT_ERROR,          // Script exited non-zero or was killed by a limit
    INTERNAL_ERROR         // Engine fault while supervising the job
};

std::string to_string(FailureKind kind);

// Resource usage measured for a finished sandbox
struct UsageStats {
    double cpu_seconds = 0.0;
    size_t peak_memory_bytes = 0;
};

struct SuccessResult {
    CollectedOutput output;
    std::chrono::milliseconds duration{0};
    UsageStats usage;
};

struct PartialOutputResult {
    std::string output;                // Raw text kept for diagnostics
    CollectionErrorKind reason = CollectionErrorKind::EMPTY;
    std::string message;
    std::chrono::milliseconds duration{0};
    UsageStats usage;
};

struct FailureResult {
    FailureKind kind = FailureKind::INTERNAL_ERROR;
    std::string message;
    std::optional<int> exit_code;
    std::string diagnostics;           // Captured stderr of the script
    UsageStats usage;
};

struct TimedOutResult {
    std::chrono::milliseconds duration{0};
};

struct CancelledResult {};

// Exactly one per job, immutable once set
using ExecutionResult = std::variant<
    SuccessResult,
    PartialOutputResult,
    FailureResult,
    TimedOutResult,
    CancelledResult
>;

// "success", "partial_output", "failure", "timed_out", "cancelled"
std::string result_kind(const ExecutionResult& result);

// Human-readable one-line summary
std::string describe(const ExecutionResult& result);

Json::Value to_json(const CollectedOutput& output);
Json::Value to_json(const ExecutionResult& result);

} // namespace runcage
