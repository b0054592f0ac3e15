#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <stdexcept>
#include "constants.h"

namespace runcage {

using Clock = std::chrono::steady_clock;

// Output formats a job may declare. Closed set: each tag has its own parser.
enum class OutputFormat {
    TABULAR,    // CSV, header row + records
    DOCUMENT,   // JSON object or array
    MARKUP      // XML, root element holding record elements
};

// Job lifecycle. Order of declaration is the only legal order of transitions.
enum class JobState {
    QUEUED,
    STARTING,
    RUNNING,
    COLLECTING,
    TERMINAL
};

enum class NetworkPolicy {
    NONE,         // No egress for any job
    TARGET_ONLY,  // Egress only for jobs that declare a target URL
    ALLOW         // Egress for every job
};

std::string to_string(OutputFormat format);
std::string to_string(JobState state);
std::string to_string(NetworkPolicy policy);

// Accepts "csv"/"tabular", "json"/"document", "xml"/"markup"
std::optional<OutputFormat> parse_output_format(const std::string& name);
std::optional<NetworkPolicy> parse_network_policy(const std::string& name);

// File extension the script is told to write ("csv", "json", "xml")
std::string format_extension(OutputFormat format);

// True when moving from `from` to `to` never goes backwards
bool is_forward_transition(JobState from, JobState to);

// Named limit set applied to one sandbox. Immutable once a job starts.
struct ResourceProfile {
    std::string name = "default";
    double cpu_share = DEFAULT_CPU_SHARE;                 // Cores (1.0 = one full core)
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    std::chrono::milliseconds wall_clock_timeout{DEFAULT_TIMEOUT_SECONDS * 1000};
    size_t max_output_bytes = MAX_OUTPUT_SIZE;
    int max_processes = MAX_PROCESSES_PER_JOB;

    // CPU seconds a job may burn in total (RLIMIT_CPU)
    long cpu_time_limit_seconds() const;

    // Compares limits only, not the name
    bool operator==(const ResourceProfile& other) const {
        return cpu_share == other.cpu_share &&
               memory_limit_bytes == other.memory_limit_bytes &&
               wall_clock_timeout == other.wall_clock_timeout &&
               max_output_bytes == other.max_output_bytes &&
               max_processes == other.max_processes;
    }
    bool operator!=(const ResourceProfile& other) const { return !(*this == other); }
};

// Per-submission narrowing of the tenant profile
struct ResourceOverrides {
    std::optional<double> cpu_share;
    std::optional<size_t> memory_limit_bytes;
    std::optional<std::chrono::milliseconds> wall_clock_timeout;
    std::optional<size_t> max_output_bytes;
};

// Kinds of admission failure, surfaced synchronously from submit()
enum class SubmissionErrorKind {
    VALIDATION,
    BACKPRESSURE,
    QUOTA_EXCEEDED
};

std::string to_string(SubmissionErrorKind kind);

class SubmissionError : public std::runtime_error {
public:
    SubmissionError(SubmissionErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    SubmissionErrorKind kind() const { return kind_; }

private:
    SubmissionErrorKind kind_;
};

class ValidationError : public SubmissionError {
public:
    explicit ValidationError(const std::string& message)
        : SubmissionError(SubmissionErrorKind::VALIDATION, "Validation error: " + message) {}
};

class BackpressureError : public SubmissionError {
public:
    explicit BackpressureError(const std::string& message)
        : SubmissionError(SubmissionErrorKind::BACKPRESSURE, "Backpressure: " + message) {}
};

class QuotaExceededError : public SubmissionError {
public:
    explicit QuotaExceededError(const std::string& message)
        : SubmissionError(SubmissionErrorKind::QUOTA_EXCEEDED, "Quota exceeded: " + message) {}
};

} // namespace runcage
